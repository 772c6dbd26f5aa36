#include "app/HttpRoutes.hpp"
#include "app/JsonSerializer.hpp"

#include <charconv>

namespace sysgraph::app {

static HttpResponse text(int status, const char* reason, std::string body) {
  HttpResponse r;
  r.status = status;
  r.reason = reason;
  r.body = std::move(body);
  return r;
}

static HttpResponse json(std::string body) {
  HttpResponse r;
  r.content_type = "application/json";
  r.body = std::move(body);
  return r;
}

// Live view: fetches /charts every 5s and draws each payload as an SVG line chart.
static constexpr std::string_view kPageHead = R"html(<!DOCTYPE html>
<html><head><meta charset="utf-8"><title>sysgraph</title>
<style>
body{font-family:sans-serif;margin:1.5em;color:#222}
.chart{margin-bottom:2em}
.chart h2{font-size:1.1em;margin:0 0 .3em}
svg{background:#fafafa;border:1px solid #ddd}
.legend span{margin-right:1em}
</style></head><body>
<h1>)html";

static constexpr std::string_view kPageTail = R"html(</h1>
<div id="charts"><p>Waiting for the first sample...</p></div>
<script>
const COLORS = ["#1f77b4", "#ff7f0e", "#2ca02c"];
const W = 800, H = 300, L = 50, R = 20, T = 10, B = 40;
function esc(s) { return String(s).replace(/[&<>"]/g, c => ({"&":"&amp;","<":"&lt;",">":"&gt;","\"":"&quot;"}[c])); }
function drawChart(c) {
  const n = c.series.length ? c.series[0].x.length : 0;
  const px = i => L + (n > 1 ? i * (W - L - R) / (n - 1) : (W - L - R) / 2);
  const py = v => T + (100 - v) * (H - T - B) / 100;
  let svg = `<svg width="${W}" height="${H}">`;
  for (let v = 0; v <= 100; v += 25)
    svg += `<line x1="${L}" x2="${W - R}" y1="${py(v)}" y2="${py(v)}" stroke="#e4e4e4"/>` +
           `<text x="${L - 8}" y="${py(v) + 4}" font-size="11" text-anchor="end">${v}</text>`;
  if (n > 0) {
    const step = Math.max(1, Math.ceil(n / 6));
    for (let i = 0; i < n; i += step)
      svg += `<text x="${px(i)}" y="${H - B + 16}" font-size="11" text-anchor="middle">${esc(c.series[0].x[i])}</text>`;
  }
  svg += `<text x="${(W + L) / 2}" y="${H - 4}" font-size="12" text-anchor="middle">${esc(c.x_axis_label)}</text>`;
  svg += `<text x="12" y="${H / 2}" font-size="12" transform="rotate(-90 12 ${H / 2})" text-anchor="middle">${esc(c.y_axis_label)}</text>`;
  let legend = "";
  c.series.forEach((s, k) => {
    const col = COLORS[k % COLORS.length];
    const pts = s.y.map((v, i) => `${px(i)},${py(v)}`).join(" ");
    svg += `<polyline fill="none" stroke="${col}" stroke-width="2" points="${pts}"/>`;
    if (s.mode.includes("markers"))
      s.y.forEach((v, i) => { svg += `<circle cx="${px(i)}" cy="${py(v)}" r="3" fill="${col}"/>`; });
    legend += `<span style="color:${col}">&#9632; ${esc(s.name)}</span>`;
  });
  svg += "</svg>";
  return `<div class="chart"><h2>${esc(c.title)}</h2>${svg}<div class="legend">${legend}</div></div>`;
}
async function refresh() {
  try {
    const r = await fetch("/charts", {cache: "no-store"});
    const d = await r.json();
    if (d.charts.length) document.getElementById("charts").innerHTML = d.charts.map(drawChart).join("");
  } catch (e) { console.error(e); }
}
refresh();
setInterval(refresh, 5000);
</script>
</body></html>
)html";

static std::string dashboard_page(model::RenderMode mode) {
  std::string body(kPageHead);
  body += page_title(mode);
  body += kPageTail;
  return body;
}

HttpResponse route_request(std::string_view request_line, const Ticker& ticker, const HistoryStore& store) {
  auto sp = request_line.find(' ');
  if (sp == std::string_view::npos) return text(400, "Bad Request", "400 Bad Request\n");
  std::string_view method = request_line.substr(0, sp);
  std::string_view target = request_line.substr(sp + 1);
  if (auto end = target.find(' '); end != std::string_view::npos) target = target.substr(0, end);
  if (auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);

  if (method != "GET") return text(405, "Method Not Allowed", "405 Method Not Allowed\n");

  if (target == "/charts") {
    return json(payloads_to_json(page_title(ticker.layout().mode()), ticker.latest()));
  }
  if (target == "/history") {
    return json(snapshot_to_json(store.snapshot()));
  }
  if (target == "/healthz") {
    return text(200, "OK", "ok\n");
  }
  if (target == "/" || target == "/index.html") {
    HttpResponse r = text(200, "OK", dashboard_page(ticker.layout().mode()));
    r.content_type = "text/html";
    return r;
  }
  return text(404, "Not Found", "404 Not Found\n");
}

std::string response_head(const HttpResponse& r) {
  std::string h = "HTTP/1.1 ";
  char num[24];
  auto [p1, e1] = std::to_chars(num, num + sizeof(num), r.status);
  h.append(num, p1);
  h += ' ';
  h += r.reason;
  h += "\r\nContent-Type: ";
  h += r.content_type;
  if (r.content_type.starts_with("text/")) h += "; charset=utf-8";
  h += "\r\nCache-Control: no-store\r\nConnection: close\r\nContent-Length: ";
  auto [p2, e2] = std::to_chars(num, num + sizeof(num), r.body.size());
  h.append(num, p2);
  h += "\r\n\r\n";
  return h;
}

} // namespace sysgraph::app
