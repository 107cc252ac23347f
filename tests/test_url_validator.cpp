#include "url_validator.hpp"
#include <cassert>
#include <string>

static bool allowed(const std::string& url) {
  std::string msg;
  return validate_surface_url(url, msg);
}

static void test_numeric_host_forms() {
  std::string msg;
  assert(!validate_surface_url("http://127.1:8080/", msg));
  assert(msg.find("127.0.0.1") != std::string::npos);
  assert(!allowed("http://2130706433/"));
  assert(!allowed("http://0177.0.0.1/"));
  assert(!allowed("http://0x7f.0.0.1/"));
  assert(!allowed("http://127.0.0.1./"));
  assert(!allowed("http://127.9.9.9/"));
  assert(!validate_surface_url("http://10.1/", msg));
  assert(msg.find("10.0.0.1") != std::string::npos);
  assert(!allowed("http://0xc0a80101/"));
  assert(!allowed("http://localhost./"));
  assert(!allowed("http://app.localhost/"));
  assert(!allowed("http://[0:0:0:0:0:0:0:1]/"));
  assert(!allowed("http://[::]/"));
  assert(!allowed("http://[::ffff:127.0.0.1]/"));
  assert(!allowed("http://[::ffff:c0a8:101]/"));
  assert(!allowed("http://127.0.0.1 .example.com/"));

  assert(allowed("http://134744072/")); // 8.8.8.8
  assert(allowed("http://[2001:db8::1]/"));
  assert(allowed("https://cafe.be/"));
  assert(allowed("https://1e100.net/"));
}

int main() {
  test_numeric_host_forms();
  assert(allowed("https://example.com"));
  assert(allowed("http://example.com:8080/path?q=1#frag"));
  assert(allowed("https://172.32.0.1/"));
  assert(allowed("https://8.8.8.8"));

  std::string msg;
  assert(!validate_surface_url("file:///etc/passwd", msg));
  assert(msg.find("protocol") != std::string::npos);
  assert(!validate_surface_url("javascript:alert(1)", msg));
  assert(!allowed(kBlankSurfaceUrl));
  assert(!allowed("not a url"));
  assert(!allowed("https://"));

  assert(!validate_surface_url("http://localhost:3000", msg));
  assert(msg.find("Localhost") != std::string::npos);
  assert(!allowed("http://127.0.0.1"));
  assert(!allowed("http://0.0.0.0"));
  assert(!allowed("http://[::1]:8080/"));
  assert(!allowed("HTTP://LOCALHOST"));

  assert(!validate_surface_url("http://10.1.2.3", msg));
  assert(msg.find("private") != std::string::npos);
  assert(!allowed("http://172.16.0.1"));
  assert(!allowed("http://172.31.255.255"));
  assert(!allowed("http://192.168.1.1"));

  ParsedUrl u;
  assert(parse_url("https://user@Example.COM:443/a/b", u, msg));
  assert(u.scheme == "https");
  assert(u.host == "example.com");
  assert(u.port == "443");
  assert(u.rest == "/a/b");
  assert(!parse_url("https://example.com:80x/", u, msg));

  assert(normalize_address_input("  https://example.com ") == "https://example.com");
  assert(normalize_address_input("example.com/docs") == "https://example.com/docs");
  assert(normalize_address_input("how to c++") == "https://www.google.com/search?q=how%20to%20c%2B%2B");
  assert(normalize_address_input("").empty());

  assert(url_host("https://docs.example.com/page") == "docs.example.com");
  assert(url_host("garbage") == "garbage");
  return 0;
}
