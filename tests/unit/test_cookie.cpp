#include "haven/protocol/Cookie.h"
#include "haven/common/Logger.h"

#include <cassert>
#include <string>

int main() {
    haven::common::Logger::Instance().SetLevel(haven::common::LogLevel::INFO);

    using haven::protocol::CrossSiteCookie;
    using haven::protocol::GetCookieValue;

    std::string v;
    assert(GetCookieValue("a=1; b=2; c=3", "b", &v) && v == "2");
    assert(GetCookieValue("key=unlock", "key", &v) && v == "unlock");
    assert(GetCookieValue(" key = x y ; other=z ", "key", &v) && v == "x y");
    assert(GetCookieValue("key=\"quoted\"", "key", &v) && v == "quoted");
    assert(GetCookieValue("key=", "key", &v) && v.empty());
    assert(!GetCookieValue("a=1; b=2", "missing", &v));
    assert(!GetCookieValue("mykey=1", "key", &v));
    assert(!GetCookieValue("", "a", &v));
    assert(!GetCookieValue("a=1", "", &v));
    LOG_INFO << "GetCookieValue PASS";

    assert(CrossSiteCookie("key", "unlock") == "key=unlock; SameSite=None; Secure");
    LOG_INFO << "CrossSiteCookie PASS";
    return 0;
}
