#include "facade/CollectorPage.hpp"
#include <cctype>

std::string CollectorPage::keyNameFor(const std::string& serviceName) {
    std::string key;
    key.reserve(serviceName.size() + 8);
    for (char c : serviceName) {
        if (c == ' ' || c == '-')
            key += '_';
        else
            key += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return key + "_API_KEY";
}

std::string CollectorPage::title(const std::string& serviceName) {
    return serviceName + " API Key Required";
}

std::string CollectorPage::escapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;";  break;
            default:   out += c;        break;
        }
    }
    return out;
}

std::string CollectorPage::html(const std::string& serviceName,
                                const std::string& serviceUrl) {
    const std::string name = escapeHtml(serviceName);

    std::string link;
    if (!serviceUrl.empty()) {
        link = "<p class=\"link\"><a href=\"" + escapeHtml(serviceUrl) +
               "\" target=\"_blank\">Get your " + name +
               " API key here</a></p>\n";
    }

    return R"HTML(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<title>)HTML" + escapeHtml(title(serviceName)) + R"HTML(</title>
<style>
  body { font-family: -apple-system, 'Segoe UI', sans-serif; margin: 0;
         padding: 24px; background: #f5f6f8; color: #222; }
  .card { background: #fff; border-radius: 8px; padding: 24px;
          box-shadow: 0 2px 8px rgba(0,0,0,0.08); }
  h2 { margin-top: 0; }
  label { display: block; font-weight: 600; margin-bottom: 6px; }
  input { width: 100%; box-sizing: border-box; padding: 10px;
          font-family: monospace; border: 1px solid #ccc; border-radius: 4px; }
  .buttons { margin-top: 20px; text-align: right; }
  button { padding: 8px 18px; margin-left: 8px; border-radius: 4px;
           border: none; cursor: pointer; }
  .save { background: #0066cc; color: #fff; }
  .cancel { background: #e0e0e0; }
  .link { text-align: center; }
  .error { color: #b00020; min-height: 1.2em; }
</style>
</head>
<body>
<div class="card">
<h2>)HTML" + name + R"HTML( API Key Required</h2>
<p>An assistant needs an API key for <b>)HTML" + name + R"HTML(</b>.
The key is saved in your local settings and is not shown to the assistant.</p>
)HTML" + link + R"HTML(<label for="api_key">API key</label>
<input id="api_key" name="api_key" type="password" autocomplete="off" autofocus>
<p class="error" id="error"></p>
<div class="buttons">
  <button class="cancel" onclick="cancel()">Cancel</button>
  <button class="save" onclick="save()">Save</button>
</div>
</div>
<script>
function save() {
  var key = document.getElementById('api_key').value.trim();
  if (!key) {
    document.getElementById('error').textContent = 'Please enter a key.';
    return;
  }
  window.userResponse = {status: 'success', data: {api_key: key}};
  window.close();
}
function cancel() {
  window.userResponse = {status: 'cancelled', message: 'User cancelled API key entry'};
  window.close();
}
document.getElementById('api_key').addEventListener('keydown', function (e) {
  if (e.key === 'Enter') save();
  if (e.key === 'Escape') cancel();
});
</script>
</body>
</html>
)HTML";
}
