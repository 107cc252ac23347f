#include "url_validator.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <arpa/inet.h>
#include <netinet/in.h>

static std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::string trim(const std::string& s) {
  size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) i++;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) j--;
  return s.substr(i, j - i);
}

bool parse_url(const std::string& url, ParsedUrl& out, std::string& msg) {
  out = ParsedUrl{};
  size_t colon = url.find(':');
  if (colon == std::string::npos || colon == 0) { msg = "Invalid URL: " + url; return false; }
  std::string scheme = url.substr(0, colon);
  if (!std::isalpha(static_cast<unsigned char>(scheme[0])) ||
      !std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) { return std::isalnum(c) || c == '+' || c == '-' || c == '.'; })) {
    msg = "Invalid URL: " + url; return false;
  }
  out.scheme = to_lower(scheme);
  if (url.compare(colon + 1, 2, "//") != 0) {
    out.rest = url.substr(colon + 1);
    return true;
  }
  size_t auth_start = colon + 3;
  size_t auth_end = url.find_first_of("/?#", auth_start);
  if (auth_end == std::string::npos) auth_end = url.size();
  std::string authority = url.substr(auth_start, auth_end - auth_start);
  out.rest = url.substr(auth_end);
  if (size_t at = authority.rfind('@'); at != std::string::npos) authority = authority.substr(at + 1);
  if (!authority.empty() && authority[0] == '[') {
    size_t close = authority.find(']');
    if (close == std::string::npos) { msg = "Invalid URL: " + url; return false; }
    out.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') { msg = "Invalid URL: " + url; return false; }
      out.port = authority.substr(close + 2);
    }
  } else {
    size_t pc = authority.rfind(':');
    out.host = authority.substr(0, pc);
    if (pc != std::string::npos) out.port = authority.substr(pc + 1);
  }
  if (!std::all_of(out.port.begin(), out.port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
    msg = "Invalid URL: " + url; return false;
  }
  out.host = to_lower(out.host);
  if (out.host.empty() && (out.scheme == "http" || out.scheme == "https")) { msg = "Invalid URL: " + url; return false; }
  return true;
}

// Numeric hosts read the way browsers read them: 127.1, 0x7f.0.0.1, 0177.0.0.1
// and 2130706433 all name 127.0.0.1. One trailing dot is allowed.
static bool parse_ipv4(std::string host, std::array<int, 4>& octets) {
  if (!host.empty() && host.back() == '.') host.pop_back();
  if (host.empty() || !std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isxdigit(c) || c == '.' || c == 'x' || c == 'X';
      }))
    return false;
  struct in_addr addr{};
  if (::inet_aton(host.c_str(), &addr) == 0) return false;
  uint32_t v = ntohl(addr.s_addr);
  octets = {static_cast<int>(v >> 24), static_cast<int>((v >> 16) & 0xff), static_cast<int>((v >> 8) & 0xff),
            static_cast<int>(v & 0xff)};
  return true;
}

// IPv6 literal (brackets already stripped); v4-mapped addresses yield their IPv4 part.
static bool parse_ipv6(const std::string& host, struct in6_addr& addr, std::optional<std::array<int, 4>>& mapped) {
  if (host.find(':') == std::string::npos) return false;
  if (::inet_pton(AF_INET6, host.c_str(), &addr) != 1) return false;
  mapped.reset();
  if (IN6_IS_ADDR_V4MAPPED(&addr)) {
    const uint8_t* b = addr.s6_addr;
    mapped = std::array<int, 4>{b[12], b[13], b[14], b[15]};
  }
  return true;
}

static std::string dotted(const std::array<int, 4>& ip) {
  return std::to_string(ip[0]) + "." + std::to_string(ip[1]) + "." + std::to_string(ip[2]) + "." + std::to_string(ip[3]);
}

static bool blocked_ipv4(const std::array<int, 4>& ip, std::string& msg) {
  if (ip[0] == 127 || ip[0] == 0) {
    msg = "Blocked URL host: " + dotted(ip) + ". Localhost is not allowed for security reasons.";
    return true;
  }
  bool priv = ip[0] == 10 || (ip[0] == 172 && ip[1] >= 16 && ip[1] <= 31) || (ip[0] == 192 && ip[1] == 168);
  if (priv) {
    msg = "Blocked private IP: " + dotted(ip) + ". Private IP addresses are not allowed for security reasons.";
    return true;
  }
  return false;
}

bool validate_surface_url(const std::string& url, std::string& msg) {
  ParsedUrl u;
  if (!parse_url(url, u, msg)) return false;
  if (u.scheme != "http" && u.scheme != "https") {
    msg = "Blocked URL protocol: " + u.scheme + ":. Only http and https are allowed.";
    return false;
  }
  if (std::any_of(u.host.begin(), u.host.end(), [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
    msg = "Invalid URL: " + url;
    return false;
  }
  std::string host = u.host;
  if (host.size() > 1 && host.back() == '.') host.pop_back();
  if (host == "localhost" || (host.size() > 10 && host.compare(host.size() - 10, 10, ".localhost") == 0)) {
    msg = "Blocked URL host: " + u.host + ". Localhost is not allowed for security reasons.";
    return false;
  }
  std::array<int, 4> ip{};
  if (parse_ipv4(u.host, ip)) return !blocked_ipv4(ip, msg);
  struct in6_addr addr6{};
  std::optional<std::array<int, 4>> mapped;
  if (parse_ipv6(u.host, addr6, mapped)) {
    if (IN6_IS_ADDR_LOOPBACK(&addr6) || IN6_IS_ADDR_UNSPECIFIED(&addr6)) {
      msg = "Blocked URL host: " + u.host + ". Localhost is not allowed for security reasons.";
      return false;
    }
    if (mapped) return !blocked_ipv4(*mapped, msg);
  }
  return true;
}

static bool looks_like_domain(const std::string& s) {
  // (label.)+tld with an optional path, tld at least two letters
  size_t end = s.find('/');
  std::string host = s.substr(0, end);
  if (host.empty() || host.find('.') == std::string::npos) return false;
  size_t start = 0;
  while (true) {
    size_t dot = host.find('.', start);
    std::string label = host.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
    if (label.empty()) return false;
    if (dot == std::string::npos) {
      return label.size() >= 2 && std::all_of(label.begin(), label.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
    }
    if (!std::all_of(label.begin(), label.end(), [](unsigned char c) { return std::isalnum(c) || c == '-'; })) return false;
    start = dot + 1;
  }
}

static std::string url_encode(const std::string& s) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '!' || c == '~' || c == '*' || c == '\'' || c == '(' || c == ')') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 15]);
    }
  }
  return out;
}

std::string normalize_address_input(const std::string& input) {
  std::string t = trim(input);
  if (t.empty()) return t;
  bool has_scheme = t.rfind("http://", 0) == 0 || t.rfind("https://", 0) == 0;
  if (has_scheme) return t;
  if (looks_like_domain(t) || t.find("localhost") != std::string::npos) return "https://" + t;
  return "https://www.google.com/search?q=" + url_encode(t);
}

std::string url_host(const std::string& url) {
  ParsedUrl u; std::string msg;
  if (!parse_url(url, u, msg) || u.host.empty()) return url;
  return u.host;
}
