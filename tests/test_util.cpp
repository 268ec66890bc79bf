#include "clob/client_base.hpp"
#include "clob/util.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

TEST_CASE("url_encode handles safe and unsafe characters") {
    using clob::url_encode;
    CHECK(url_encode("simple") == "simple");
    CHECK(url_encode("hello world") == "hello%20world");
    CHECK(url_encode("1+1=2") == "1%2B1%3D2");
    CHECK(url_encode("symbols-_.~") == "symbols-_.~");
}

TEST_CASE("filter_empty removes empty values") {
    using clob::filter_empty;
    clob::QueryParams params = {
        {"token_id", "123"},
        {"market", ""},
        {"asset_type", "COLLATERAL"},
        {"signature_type", "0"}
    };

    const auto filtered = filter_empty(params);
    REQUIRE(filtered.size() == 3);
    CHECK(filtered[0].first == "token_id");
    CHECK(filtered[1].first == "asset_type");
    CHECK(filtered[2].first == "signature_type");
}

TEST_CASE("build_query_string preserves order and encodes values") {
    using clob::build_query_string;
    clob::QueryParams params = {
        {"token_id", "7163"},
        {"next_cursor", "MA=="},
        {"note", "space value"}
    };

    CHECK(build_query_string(params) == "token_id=7163&next_cursor=MA%3D%3D&note=space%20value");
}

TEST_CASE("to_upper_copy and trim_copy") {
    CHECK(clob::to_upper_copy("matched") == "MATCHED");
    CHECK(clob::to_upper_copy("already UPPER") == "ALREADY UPPER");
    CHECK(clob::trim_copy("  LIVE \n") == "LIVE");
    CHECK(clob::trim_copy("   ").empty());
}

TEST_CASE("format_decimal renders fixed precision") {
    CHECK(clob::format_decimal(0.456, 2) == "0.46");
    CHECK(clob::format_decimal(12.0, 6) == "12.000000");
}

TEST_CASE("base64 encoding accepts both alphabets") {
    CHECK(clob::base64_encode("hello") == "aGVsbG8=");
    CHECK(clob::base64_decode("aGVsbG8=") == "hello");
    CHECK(clob::base64_decode("aGVsbG8") == "hello");
    CHECK(clob::to_base64url("ab+/cd==") == "ab-_cd==");
    CHECK(clob::base64_decode(clob::to_base64url(clob::base64_encode("\xfb\xff\xfe"))) == "\xfb\xff\xfe");
    CHECK(clob::base64_encode("").empty());
}

TEST_CASE("base64_decode rejects garbage") {
    CHECK_THROWS_AS(clob::base64_decode("!!!!"), std::invalid_argument);
}

TEST_CASE("L2 signature is url-safe HMAC-SHA256 over timestamp, method, path and body") {
    const auto signature = clob::build_l2_signature("c2VjcmV0LWtleQ==", 1700000000, "post", "/order", "{\"a\":1}");
    CHECK(signature == "Y3JUrDozmq-URLlwR41ejyzrxKxLS_J7CEMuOnFagcY=");
}

TEST_CASE("json helpers tolerate strings, numbers and missing keys") {
    const auto obj = nlohmann::json::parse(R"({"a":"0.55","b":3,"c":null,"d":"yes","e":true,"f":"1"})");
    CHECK(clob::get_double_optional(obj, "a") == Catch::Approx(0.55));
    CHECK(clob::get_double_optional(obj, "b") == Catch::Approx(3.0));
    CHECK(clob::get_double_optional(obj, "c", 7.0) == Catch::Approx(7.0));
    CHECK(clob::get_double_optional(obj, "d", -1.0) == Catch::Approx(-1.0));
    CHECK(clob::get_double_optional(obj, "missing", 2.5) == Catch::Approx(2.5));
    CHECK(clob::get_string_optional(obj, "b") == "3");
    CHECK(clob::get_string_optional(obj, "missing").empty());
    CHECK(clob::get_bool_optional(obj, "e"));
    CHECK(clob::get_bool_optional(obj, "f"));
    CHECK_FALSE(clob::get_bool_optional(obj, "c"));
}
