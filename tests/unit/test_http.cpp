#include "haven/protocol/HttpContext.h"
#include "haven/protocol/HttpResponse.h"
#include "haven/network/Buffer.h"
#include "haven/common/Logger.h"
#include <cassert>
#include <string>

using namespace haven::protocol;
using namespace haven::network;
using namespace haven::common;

void testParseRequest() {
    HttpContext context;
    Buffer buf;

    // Simulate partial arrival
    std::string inputPart1 = "GET /fetch?url=x HTTP/1.1\r\nHost: ";
    std::string inputPart2 = "localhost\r\nx-url: http://example.com/\r\nAccept: */*\r\n\r\n";

    buf.Append(inputPart1);
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(!context.gotAll());

    buf.Append(inputPart2);
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kGet);
    assert(req.methodString() == "GET");
    assert(req.getVersion() == HttpRequest::kHttp11);
    assert(req.path() == "/fetch");
    assert(req.query() == "?url=x");
    assert(req.getHeader("host") == "localhost");
    assert(req.getHeader("X-URL") == "http://example.com/");
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Parse Request PASS";
}

void testParseContentLengthBody() {
    HttpContext context;
    Buffer buf;
    buf.Append("POST /submit HTTP/1.1\r\nHost: localhost\r\nContent-Length: 5\r\n\r\nhel");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(!context.gotAll());
    // The rest of the body plus the start of a pipelined request.
    buf.Append("loGET / HTTP/1.1\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kPost);
    assert(req.path() == "/submit");
    assert(req.body() == "hello");
    assert(buf.RetrieveAllAsString() == "GET / HTTP/1.1\r\n");
    LOG_INFO << "Parse Content-Length Body PASS";
}

void testParseChunkedBody() {
    HttpContext context;
    Buffer buf;
    std::string input =
        "POST /chunk HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Transfer-Encoding: gzip, Chunked\r\n"
        "\r\n"
        "5;name=value\r\n"
        "hello\r\n"
        "6\r\n"
        " world\r\n"
        "0\r\n"
        "X-Checksum: abc\r\n"
        "\r\n";
    buf.Append(input);
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().body() == "hello world");
    assert(buf.ReadableBytes() == 0);
    LOG_INFO << "Parse Chunked Body PASS";
}

void testRepeatedHeadersFold() {
    HttpContext context;
    Buffer buf;
    buf.Append("GET / HTTP/1.1\r\n"
               "Accept: text/html\r\n"
               "accept: */*\r\n"
               "Cookie: a=1\r\n"
               "Cookie: key=unlock\r\n"
               "\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().getHeader("Accept") == "text/html, */*");
    assert(context.request().getHeader("Cookie") == "a=1; key=unlock");
    LOG_INFO << "Repeated Headers Fold PASS";
}

void testHttp10AndCustomMethod() {
    HttpContext context;
    Buffer buf;
    buf.Append("PURGE /x HTTP/1.0\r\n\r\n");
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().getMethod() == HttpRequest::kOther);
    assert(context.request().methodString() == "PURGE");
    assert(context.request().getVersion() == HttpRequest::kHttp10);

    context.reset();
    buf.Append("GET / HTTP/2.0\r\n\r\n");
    assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    LOG_INFO << "HTTP/1.0 And Custom Method PASS";
}

void testMalformedRequests() {
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET /\r\n\r\n");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\nno colon here\r\n\r\n");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("POST / HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    {
        HttpContext context;
        Buffer buf;
        buf.Append("GET / HTTP/1.1\r\nX-Big: ");
        buf.Append(std::string(HttpContext::kMaxHeaderBytes, 'a'));
        assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    }
    LOG_INFO << "Malformed Requests PASS";
}

void testResponseGen() {
    HttpResponse resp(true);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setContentType("text/plain");
    resp.addHeader("Set-Cookie", "a=1");
    resp.addHeader("Set-Cookie", "b=2");
    resp.addHeader("Content-Length", "999");
    resp.setBody("Hello World");

    Buffer buf;
    resp.appendToBuffer(&buf);
    std::string output = buf.RetrieveAllAsString();
    assert(output.find("HTTP/1.1 200 OK\r\n") == 0);
    assert(output.find("Content-Type: text/plain\r\n") != std::string::npos);
    assert(output.find("Set-Cookie: a=1\r\nSet-Cookie: b=2\r\n") != std::string::npos);
    assert(output.find("Content-Length: 11\r\n") != std::string::npos);
    assert(output.find("999") == std::string::npos);
    assert(output.find("Connection: close\r\n") != std::string::npos);
    assert(output.size() > 11 && output.compare(output.size() - 15, 15, "\r\n\r\nHello World") == 0);
    LOG_INFO << "Response Gen PASS";
}

void testResponseHeadOnlyAndFraming() {
    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setBody("0123456789");
    resp.setHeadOnly(true);
    Buffer buf;
    resp.appendToBuffer(&buf);
    std::string output = buf.RetrieveAllAsString();
    assert(output.find("Content-Length: 10\r\n") != std::string::npos);
    assert(output.find("Connection: keep-alive\r\n") != std::string::npos);
    assert(output.compare(output.size() - 4, 4, "\r\n\r\n") == 0);

    HttpResponse chunked(false);
    chunked.setStatusCode(418);
    chunked.appendHeadToBuffer(&buf, HttpResponse::kChunked, 0);
    output = buf.RetrieveAllAsString();
    assert(output.find("HTTP/1.1 418 \r\n") == 0);
    assert(output.find("Transfer-Encoding: chunked\r\n") != std::string::npos);

    HttpResponse untilClose(false);
    untilClose.setStatusCode(200);
    untilClose.appendHeadToBuffer(&buf, HttpResponse::kUntilClose, 0);
    output = buf.RetrieveAllAsString();
    assert(output.find("Connection: close\r\n") != std::string::npos);
    assert(output.find("Content-Length") == std::string::npos);

    HttpResponse noContent(false);
    noContent.setStatusCode(HttpResponse::k204NoContent);
    noContent.setBody("ignored");
    noContent.appendToBuffer(&buf);
    output = buf.RetrieveAllAsString();
    assert(output.find("HTTP/1.1 204 No Content\r\n") == 0);
    assert(output.find("ignored") == std::string::npos);
    LOG_INFO << "Response HEAD And Framing PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseRequest();
    testParseContentLengthBody();
    testParseChunkedBody();
    testRepeatedHeadersFold();
    testHttp10AndCustomMethod();
    testMalformedRequests();
    testResponseGen();
    testResponseHeadOnlyAndFraming();
    return 0;
}
