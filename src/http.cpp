// -----------------------------------------------------------------------------
// http.cpp - HTTP/1.1 text helpers for iptrackd
//
// Parsing is intentionally narrow: request line + headers, Content-Length
// bodies, url-encoded forms. See include/iptrack/http.hpp.
// -----------------------------------------------------------------------------

#include "iptrack/http.hpp"

#include <cctype>     // std::tolower, std::isxdigit
#include <sstream>    // response assembly
#include <vector>

namespace iptrack {
namespace http {

// ---------- local helpers ----------

static std::string lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
    return s.substr(b, e - b);
}

// RFC 7230 token characters, used for method and header names.
static bool is_token(const std::string& s) {
    if (s.empty()) return false;
    static const std::string extra = "!#$%&'*+-.^_`|~";
    for (char c : s) {
        if (std::isalnum((unsigned char)c)) continue;
        if (extra.find(c) != std::string::npos) continue;
        return false;
    }
    return true;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// ---------- Request ----------

std::string Request::header(const std::string& name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

// ---------- parsing ----------

bool parse_request_head(const std::string& head, Request& out, std::string& err) {
    // Split into lines; accept bare "\n" as well as "\r\n".
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < head.size()) {
        size_t nl = head.find('\n', pos);
        std::string line = head.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;                       // blank line ends the head
        lines.push_back(line);
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    if (lines.empty()) { err = "empty request"; return false; }

    // Request line: METHOD SP TARGET SP VERSION
    const std::string& rl = lines.front();
    size_t sp1 = rl.find(' ');
    size_t sp2 = (sp1 == std::string::npos) ? std::string::npos : rl.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos) {
        err = "malformed request line";
        return false;
    }
    Request req;
    req.method = rl.substr(0, sp1);
    req.target = rl.substr(sp1 + 1, sp2 - sp1 - 1);
    const std::string version = rl.substr(sp2 + 1);

    if (!is_token(req.method))                 { err = "malformed method"; return false; }
    if (req.target.empty() || req.target[0] != '/') { err = "unsupported request target"; return false; }
    if (version.compare(0, 7, "HTTP/1.") != 0)  { err = "unsupported HTTP version"; return false; }

    const size_t q = req.target.find('?');
    const std::string raw_path = req.target.substr(0, q);
    if (q != std::string::npos) req.query = req.target.substr(q + 1);
    req.path = url_decode(raw_path, false);

    // Headers: "Name: value". Repeated names are joined with ", ".
    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& h = lines[i];
        size_t colon = h.find(':');
        if (colon == std::string::npos) { err = "malformed header line"; return false; }
        std::string name = h.substr(0, colon);
        if (!is_token(name)) { err = "malformed header name"; return false; }
        name = lower(name);
        std::string value = trim(h.substr(colon + 1));

        auto it = req.headers.find(name);
        if (it == req.headers.end()) req.headers.emplace(std::move(name), std::move(value));
        else                         it->second += ", " + value;
    }

    out = std::move(req);
    return true;
}

bool content_length(const Request& req, std::size_t& out) {
    out = 0;
    auto it = req.headers.find("content-length");
    if (it == req.headers.end()) return true;
    const std::string& v = it->second;
    if (v.empty() || v.size() > 19) return false;
    std::size_t n = 0;
    for (char c : v) {
        if (c < '0' || c > '9') return false;
        n = n * 10 + static_cast<std::size_t>(c - '0');
    }
    out = n;
    return true;
}

std::string url_decode(const std::string& text, bool plus_as_space) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) { out += ' '; continue; }
        out += c;
    }
    return out;
}

std::map<std::string, std::string> parse_form(const std::string& encoded) {
    std::map<std::string, std::string> out;
    size_t pos = 0;
    while (pos <= encoded.size()) {
        size_t amp = encoded.find('&', pos);
        std::string pair = encoded.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq), true);
            std::string val = (eq == std::string::npos) ? std::string()
                                                        : url_decode(pair.substr(eq + 1), true);
            out.emplace(std::move(key), std::move(val));   // emplace keeps the first value
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return out;
}

std::string form_value(const Request& req, const std::string& key) {
    const std::string ctype = lower(req.header("content-type"));
    const bool form_body = (req.method == "POST" || req.method == "PUT" || req.method == "PATCH") &&
                           ctype.compare(0, 33, "application/x-www-form-urlencoded") == 0;
    if (form_body) {
        auto body = parse_form(req.body);
        auto it = body.find(key);
        if (it != body.end()) return it->second;
    }
    auto query = parse_form(req.query);
    auto it = query.find(key);
    return it == query.end() ? std::string() : it->second;
}

// ---------- responses ----------

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "Unknown";
}

Response error(int status, const std::string& message) {
    Response r;
    r.status = status;
    r.content_type = "text/plain; charset=utf-8";
    r.body = message + "\n";
    return r;
}

std::string serialize(const Response& resp) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status << ' ' << status_text(resp.status) << "\r\n"
        << "Content-Type: " << resp.content_type << "\r\n"
        << "Content-Length: " << resp.body.size() << "\r\n";
    if (resp.status >= 400) oss << "X-Content-Type-Options: nosniff\r\n";
    oss << "Connection: close\r\n"
        << "\r\n"
        << resp.body;
    return oss.str();
}

} // namespace http
} // namespace iptrack
