#pragma once

namespace codeauditor {

// {{ENDPOINT}} is replaced with the configured GraphQL endpoint before serving
inline const char* kGraphiQLHtml = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8"><meta name="viewport" content="width=device-width,initial-scale=1">
<title>Code Auditor GraphiQL</title>
<link rel="stylesheet" href="https://unpkg.com/graphiql@3/graphiql.min.css">
<style>
html,body{height:100%;margin:0;overflow:hidden}
#graphiql{height:100vh}
</style>
</head>
<body>
<div id="graphiql">Loading...</div>
<script crossorigin src="https://unpkg.com/react@18/umd/react.production.min.js"></script>
<script crossorigin src="https://unpkg.com/react-dom@18/umd/react-dom.production.min.js"></script>
<script crossorigin src="https://unpkg.com/graphiql@3/graphiql.min.js"></script>
<script>
const fetcher = GraphiQL.createFetcher({ url: '{{ENDPOINT}}' });
const defaultQuery = `# Recent verdicts and aggregate counts
{
  stats { total valid invalid validityRate commonDiagnostics { diagnostic count } }
  audits(limit: 10) { id prompt isValid diagnostic createdAt }
}
`;
ReactDOM.createRoot(document.getElementById('graphiql')).render(
  React.createElement(GraphiQL, { fetcher, defaultQuery, isHeadersEditorEnabled: false })
);
</script>
</body>
</html>
)HTML";

} // namespace codeauditor
