#include <catch2/catch.hpp>

#include "core/cancellation.hpp"
#include "core/errors.hpp"
#include "core/head_probe.hpp"
#include "test_server.hpp"

using namespace resumedl;

namespace {
test_server::options serve(const std::string& payload) {
    test_server::options opts;
    opts.payload = payload;
    return opts;
}
} // namespace

TEST_CASE("probe reports size and range support", "[head_probe]") {
    test_server server(serve(make_payload(8052)));
    http_client client;

    head_result head = probe_head(client, server.url(), {}, nullptr, nullptr);
    REQUIRE(head.remote_size == 8052);
    REQUIRE(head.can_resume);
    REQUIRE(head.response.status_code == 200);
    REQUIRE(head.response.header("Accept-Ranges") == "bytes");
    REQUIRE(server.count("HEAD") == 1);
    REQUIRE(server.count("GET") == 0);
}

TEST_CASE("probe without Accept-Ranges cannot resume", "[head_probe]") {
    test_server::options opts = serve(make_payload(100));
    opts.accept_ranges = false;
    test_server server(opts);
    http_client client;

    head_result head = probe_head(client, server.url(), {}, nullptr, nullptr);
    REQUIRE(head.remote_size == 100);
    REQUIRE_FALSE(head.can_resume);
}

TEST_CASE("probe without Content-Length has unknown size", "[head_probe]") {
    test_server::options opts = serve(make_payload(100));
    opts.send_content_length = false;
    test_server server(opts);
    http_client client;

    head_result head = probe_head(client, server.url(), {}, nullptr, nullptr);
    REQUIRE(head.remote_size == unknown_size);
    REQUIRE_FALSE(head.can_resume);
}

TEST_CASE("probe sends the extra headers", "[head_probe]") {
    test_server server(serve("abc"));
    http_client client;

    probe_head(client, server.url(), {{"X-Token", "secret"}}, cancellation_context::create(),
               nullptr);
    auto requests = server.requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].method == "HEAD");
    REQUIRE(requests[0].headers.at("x-token") == "secret");
    REQUIRE(requests[0].headers.at("user-agent") == "resumedl/1.0");
}

TEST_CASE("accept predicate can veto the download", "[head_probe]") {
    test_server server(serve(make_payload(8052)));
    http_client client;

    accept_predicate_t too_big = [](const http_response& head, std::string& reason) {
        if (head.content_length > 2000) {
            reason = "insufficient space for download";
            return false;
        }
        return true;
    };

    try {
        probe_head(client, server.url(), {}, cancellation_context::create(), too_big);
        FAIL("expected rejected_error");
    } catch (const rejected_error& e) {
        REQUIRE(std::string(e.what()) == "insufficient space for download");
        REQUIRE(e.kind() == error_kind::rejected);
    }
}

TEST_CASE("malformed URLs fail validation", "[head_probe]") {
    http_client client;
    auto ctx = cancellation_context::create();
    REQUIRE_THROWS_AS(probe_head(client, "asd://go.bug.st/test.txt", {}, ctx, nullptr),
                      validation_error);
    REQUIRE_THROWS_AS(probe_head(client, "://", {}, ctx, nullptr), validation_error);
}

TEST_CASE("unreachable server is a network error", "[head_probe]") {
    std::string url;
    {
        test_server server(serve("abc"));
        url = server.url();
    }
    http_client client;
    REQUIRE_THROWS_AS(probe_head(client, url, {}, cancellation_context::create(), nullptr),
                      network_error);
}

TEST_CASE("probe on a cancelled context fails with cancelled_error", "[head_probe]") {
    test_server server(serve("abc"));
    http_client client;
    auto ctx = cancellation_context::create();
    ctx->cancel();
    REQUIRE_THROWS_AS(probe_head(client, server.url(), {}, ctx, nullptr), cancelled_error);
    REQUIRE(server.count("HEAD") == 0);
}
