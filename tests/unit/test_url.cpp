#include "haven/protocol/Url.h"
#include "haven/protocol/HttpHeaders.h"
#include "haven/common/Logger.h"

#include <cassert>
#include <string>

using namespace haven::protocol;
using namespace haven::common;

void testParse() {
    Url url;
    std::string err;
    assert(Url::Parse("HTTP://Example.COM/a/b?x=1#frag", &url, &err));
    assert(url.scheme == "http");
    assert(url.host == "example.com");
    assert(url.port == 80);
    assert(url.path == "/a/b");
    assert(url.query == "x=1");
    assert(url.defaultPort());
    assert(!url.secure());
    assert(url.hostHeader() == "example.com");
    assert(url.target() == "/a/b?x=1");
    assert(url.toString() == "http://example.com/a/b?x=1");

    assert(Url::Parse("https://example.com:8443", &url, &err));
    assert(url.secure());
    assert(url.port == 8443);
    assert(url.path == "/");
    assert(url.hostHeader() == "example.com:8443");

    assert(Url::Parse("wss://[::1]:9000/socket", &url, &err));
    assert(url.host == "::1");
    assert(url.port == 9000);
    assert(url.hostHeader() == "[::1]:9000");

    assert(Url::Parse("ws://h?q", &url, &err));
    assert(url.port == 80 && url.path == "/" && url.query == "q");
    LOG_INFO << "Url Parse PASS";
}

void testParseRejects() {
    Url url;
    std::string err;
    assert(!Url::Parse("not a url", &url, &err));
    assert(err == "Invalid URL: not a url");
    assert(!Url::Parse("ftp://example.com/", &url, &err));
    assert(err == "Unsupported URL scheme: ftp");
    assert(!Url::Parse("http://user:pw@example.com/", &url, &err));
    assert(!Url::Parse("http:///path", &url, &err));
    assert(!Url::Parse("http://example.com:0/", &url, &err));
    assert(!Url::Parse("http://example.com:70000/", &url, &err));
    assert(!Url::Parse("http://example.com:8o/", &url, &err));
    assert(!Url::Parse("http://exa mple.com/", &url, &err));
    assert(!Url::Parse("http://example.com/a b", &url, &err));
    LOG_INFO << "Url Parse Rejects PASS";
}

void testResolve() {
    Url base;
    std::string err;
    assert(Url::Parse("http://example.com/dir/page?x=1", &base, &err));

    Url out;
    assert(base.Resolve("/other?y=2", &out, &err));
    assert(out.toString() == "http://example.com/other?y=2");

    assert(base.Resolve("next", &out, &err));
    assert(out.toString() == "http://example.com/dir/next");

    assert(base.Resolve("../up/./file", &out, &err));
    assert(out.toString() == "http://example.com/up/file");

    assert(base.Resolve("?z=3", &out, &err));
    assert(out.toString() == "http://example.com/dir/page?z=3");

    assert(base.Resolve("//cdn.example.net/lib.js", &out, &err));
    assert(out.toString() == "http://cdn.example.net/lib.js");

    assert(base.Resolve("https://secure.example.com:444/", &out, &err));
    assert(out.scheme == "https" && out.port == 444);

    assert(!base.Resolve("ftp://x/", &out, &err));
    LOG_INFO << "Url Resolve PASS";
}

void testQueryParams() {
    std::string v;
    assert(GetQueryParam("?url=wss%3A%2F%2Fa.b%2Fc%3Fd%3D1&x=y", "url", &v));
    assert(v == "wss://a.b/c?d=1");
    assert(GetQueryParam("a=1&b=two+words", "b", &v) && v == "two words");
    assert(GetQueryParam("flag&a=1", "flag", &v) && v.empty());
    assert(!GetQueryParam("?a=1", "url", &v));
    assert(!GetQueryParam("", "url", &v));

    assert(PercentDecode("a%20b%zz%4", false) == "a b%zz%4");
    assert(PercentDecode("a+b", false) == "a+b");
    assert(PercentDecode("a+b", true) == "a b");
    LOG_INFO << "Query Params PASS";
}

void testHeaderHelpers() {
    assert(ToLowerAscii("Content-Type") == "content-type");
    assert(IEquals("X-Url", "x-URL"));
    assert(!IEquals("x-url", "x-urls"));
    assert(HeaderHasToken("keep-alive, Upgrade", "upgrade"));
    assert(!HeaderHasToken("upgraded", "upgrade"));
    assert(TrimOws(" \t value\t ") == "value");

    HeaderList headers;
    headers.emplace_back("Set-Cookie", "a=1");
    headers.emplace_back("Accept", "*/*");
    headers.emplace_back("set-cookie", "b=2");
    assert(FindHeader(headers, "SET-COOKIE") != nullptr);
    assert(*FindHeader(headers, "SET-COOKIE") == "a=1");
    assert(FindHeader(headers, "Host") == nullptr);
    SetHeader(&headers, "accept", "text/html");
    assert(*FindHeader(headers, "Accept") == "text/html");
    assert(RemoveHeader(&headers, "Set-Cookie") == 2);
    assert(headers.size() == 1);
    LOG_INFO << "Header Helpers PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParse();
    testParseRejects();
    testResolve();
    testQueryParams();
    testHeaderHelpers();
    return 0;
}
