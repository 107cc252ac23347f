#pragma once
/*
 * UrlValidator
 *
 * Purpose: address-safety rules for native surfaces.
 * Accepts http/https only; rejects loopback hosts and private IPv4 ranges
 * (10/8, 172.16/12, 192.168/16). Used for live creation and for restoring
 * stored sessions.
 */
#include <string>

inline constexpr const char* kBlankSurfaceUrl = "about:blank";

struct ParsedUrl {
  std::string scheme; // lower-case, without ':'
  std::string host;   // lower-case, brackets stripped for IPv6
  std::string port;
  std::string rest;   // path, query and fragment
};

bool parse_url(const std::string& url, ParsedUrl& out, std::string& msg);
// false with a descriptive msg when the address must not be opened.
bool validate_surface_url(const std::string& url, std::string& msg);
// Address-bar input: URL-like text gets https:// when scheme-less, anything
// else becomes a web search.
std::string normalize_address_input(const std::string& input);
std::string url_host(const std::string& url);
