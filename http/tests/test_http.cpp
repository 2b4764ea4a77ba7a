#include <catch2/catch_test_macros.hpp>
#include "http_request.hpp"
#include "http_response.hpp"
#include "http_router.hpp"
#include "access_gate.hpp"
#include "mail_json.hpp"
#include "mail_handlers.hpp"
#include "request_engine.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

using namespace mailcatch;
using namespace mailcatch::http;

namespace {

class TempDirectory {
public:
    TempDirectory() {
        path_ = std::filesystem::temp_directory_path() / "mailcatch_http_test" /
                std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

Mail make_mail(const std::string& id) {
    Mail mail;
    mail.id = id;
    mail.from = "a@x";
    mail.to = {"b@y"};
    mail.subject = "subject " + id;
    mail.body = "body " + id;
    mail.received_at = std::chrono::system_clock::time_point{std::chrono::microseconds{1700000000123456}};
    return mail;
}

// Router, gate and handlers wired the way the server wires them
struct EngineFixture {
    TempDirectory temp;
    std::shared_ptr<MailStore> store;
    AccessGate gate{"secret"};
    std::unique_ptr<MailHandlers> handlers;
    Router router;
    std::unique_ptr<RequestEngine> engine;

    explicit EngineFixture(CorruptRecordPolicy policy = CorruptRecordPolicy::FailFast) {
        store = std::make_shared<MailStore>(temp.path() / "mails.db");
        REQUIRE(store->initialize());
        handlers = std::make_unique<MailHandlers>(store, policy);
        handlers->register_routes(router);
        engine = std::make_unique<RequestEngine>(router, gate);
    }

    void put(const std::string& id) {
        store->put(id, make_mail(id));
    }

    // Writes a value that does not decode, bypassing the store
    void put_garbage(const std::string& id) {
        sqlite3* db = nullptr;
        REQUIRE(sqlite3_open((temp.path() / "mails.db").string().c_str(), &db) == SQLITE_OK);
        std::string sql = "INSERT OR REPLACE INTO mails (id, data) VALUES ('" + id + "', x'ff00ff');";
        REQUIRE(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(db);
    }

    std::optional<Response> request(const std::string& line) {
        return engine->handle(line);
    }
};

std::vector<std::string> ids_of(const Response& response) {
    std::vector<std::string> ids;
    for (const auto& item : nlohmann::json::parse(response.body)) {
        ids.push_back(item.at("id").get<std::string>());
    }
    return ids;
}

}  // namespace

TEST_CASE("Request line parsing", "[http][request]") {
    SECTION("Method, path and query") {
        auto result = parse_request_line("GET /mails?limit=3&offset=5 HTTP/1.1");
        REQUIRE(result.status == ParseStatus::OK);
        REQUIRE(result.request.method == Method::Get);
        REQUIRE(result.request.path == "/mails");
        REQUIRE(result.request.query_value("limit") == "3");
        REQUIRE(result.request.query_value("offset") == "5");
    }

    SECTION("Version token is optional") {
        auto result = parse_request_line("delete /mails/abc");
        REQUIRE(result.status == ParseStatus::OK);
        REQUIRE(result.request.method == Method::Delete);
        REQUIRE(result.request.path == "/mails/abc");
    }

    SECTION("Fewer than two tokens is malformed") {
        REQUIRE(parse_request_line("").status == ParseStatus::MALFORMED);
        REQUIRE(parse_request_line("GET").status == ParseStatus::MALFORMED);
        REQUIRE(parse_request_line("   ").status == ParseStatus::MALFORMED);
    }

    SECTION("Unknown method") {
        REQUIRE(parse_request_line("PATCH /mails HTTP/1.1").status == ParseStatus::UNKNOWN_METHOD);
        REQUIRE(parse_request_line("OPTIONS * HTTP/1.1").status == ParseStatus::UNKNOWN_METHOD);
    }

    SECTION("Methods are case-insensitive") {
        REQUIRE(parse_method("post") == Method::Post);
        REQUIRE(parse_method("Put") == Method::Put);
        REQUIRE_FALSE(parse_method("HEAD").has_value());
        REQUIRE(method_to_string(Method::Delete) == "DELETE");
    }

    SECTION("Bytes outside ASCII never match a method") {
        REQUIRE_FALSE(parse_method("G\xC9T").has_value());
        REQUIRE_FALSE(parse_method("\xE7et").has_value());
        REQUIRE(parse_request_line("\xFF\xFE /mails HTTP/1.1").status == ParseStatus::UNKNOWN_METHOD);
    }
}

TEST_CASE("Query string decoding", "[http][request]") {
    SECTION("Form encoding") {
        REQUIRE(url_decode("a+b%20c") == "a b c");
        REQUIRE(url_decode("%41%42") == "AB");
        REQUIRE(url_decode("100%") == "100%");
        REQUIRE(url_decode("%zz") == "%zz");
        REQUIRE(url_decode("%4") == "%4");
    }

    SECTION("Last value wins") {
        auto params = parse_query("k=one&k=two");
        REQUIRE(params.at("k") == "two");
    }

    SECTION("Key without value and empty pairs") {
        auto params = parse_query("flag&&x=1=2");
        REQUIRE(params.at("flag").empty());
        REQUIRE(params.at("x") == "1=2");
        REQUIRE(params.size() == 2);
    }
}

TEST_CASE("Response serialization", "[http][response]") {
    REQUIRE(Response::empty(status::BAD_REQUEST).serialize() == "HTTP/1.1 400 Bad Request\r\n\r\n");
    REQUIRE(Response::empty(status::NOT_FOUND).serialize() == "HTTP/1.1 404 Not Found\r\n\r\n");
    REQUIRE(Response::empty(status::INTERNAL_ERROR).serialize() ==
            "HTTP/1.1 500 Internal Server Error\r\n\r\n");
    REQUIRE(Response::empty(status::OK).serialize() == "HTTP/1.1 200 OK\r\n\r\n");

    auto json = Response::json(nlohmann::json::array());
    REQUIRE(json.serialize() ==
            "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 2\r\n\r\n[]");
}

TEST_CASE("Router matching", "[http][router]") {
    SECTION("Parameter binding") {
        auto params = Router::match_path("/mails/:mail_id", "/mails/42");
        REQUIRE(params.has_value());
        REQUIRE(params->at("mail_id") == "42");
    }

    SECTION("Segment counts must agree") {
        REQUIRE_FALSE(Router::match_path("/mails/:mail_id", "/mails/42/x").has_value());
        REQUIRE_FALSE(Router::match_path("/mails/:mail_id", "/mails").has_value());
    }

    SECTION("One trailing slash is ignored") {
        REQUIRE(Router::match_path("/mails", "/mails/").has_value());
        REQUIRE(Router::match_path("/mails/", "/mails").has_value());
        REQUIRE_FALSE(Router::match_path("/mails", "/mails//").has_value());
    }

    SECTION("Literal segments match exactly") {
        REQUIRE_FALSE(Router::match_path("/mails", "/Mails").has_value());
        REQUIRE_FALSE(Router::match_path("/mails", "mails").has_value());
    }

    SECTION("First registered match wins") {
        Router router;
        router.add(Method::Get, "/mails/:id", [](const Request&) { return Response::empty(status::OK); });
        router.add(Method::Get, "/mails/latest", [](const Request&) { return Response::empty(status::NOT_FOUND); });

        auto match = router.match(Method::Get, "/mails/latest");
        REQUIRE(match.has_value());
        REQUIRE(match->route->pattern == "/mails/:id");
        REQUIRE(match->params.at("id") == "latest");
    }

    SECTION("Method must match") {
        Router router;
        router.add(Method::Get, "/mails", [](const Request&) { return Response::empty(status::OK); });
        REQUIRE_FALSE(router.match(Method::Post, "/mails").has_value());
        REQUIRE(router.size() == 1);
    }
}

TEST_CASE("Access gate", "[http][gate]") {
    AccessGate gate("secret");

    Request request;
    REQUIRE_FALSE(gate.allows(request));

    request.query["k"] = "wrong!";
    REQUIRE_FALSE(gate.allows(request));

    request.query["k"] = "secre";
    REQUIRE_FALSE(gate.allows(request));

    request.query["k"] = "secret";
    REQUIRE(gate.allows(request));

    REQUIRE_THROWS_AS(AccessGate(""), std::invalid_argument);
}

TEST_CASE("Mail JSON", "[http][json]") {
    auto json = to_json(make_mail("m1"));
    REQUIRE(json.at("id") == "m1");
    REQUIRE(json.at("from") == "a@x");
    REQUIRE(json.at("to") == nlohmann::json::array({"b@y"}));
    REQUIRE(json.at("subject") == "subject m1");
    REQUIRE(json.at("body") == "body m1");
    REQUIRE(json.at("received_at") == "2023-11-14T22:13:20.123456Z");

    auto epoch = std::chrono::system_clock::time_point{};
    REQUIRE(format_timestamp(epoch) == "1970-01-01T00:00:00.000000Z");
}

TEST_CASE("Request engine", "[http][engine]") {
    EngineFixture f;

    SECTION("Malformed request line") {
        auto response = f.request("");
        REQUIRE(response.has_value());
        REQUIRE(response->serialize() == "HTTP/1.1 400 Bad Request\r\n\r\n");
    }

    SECTION("Unknown method closes silently") {
        REQUIRE_FALSE(f.request("PATCH /mails?k=secret HTTP/1.1").has_value());
    }

    SECTION("Missing or wrong key closes silently") {
        f.put("m1");
        REQUIRE_FALSE(f.request("GET /mails HTTP/1.1").has_value());
        REQUIRE_FALSE(f.request("GET /mails?k=nope HTTP/1.1").has_value());
        REQUIRE_FALSE(f.request("GET /unknown HTTP/1.1").has_value());
    }

    SECTION("Unmatched route") {
        auto response = f.request("GET /unknown?k=secret HTTP/1.1");
        REQUIRE(response.has_value());
        REQUIRE(response->status == status::NOT_FOUND);
        REQUIRE(response->body.empty());

        REQUIRE(f.request("POST /mails?k=secret HTTP/1.1")->status == status::NOT_FOUND);
    }

    SECTION("Get by id") {
        f.put("m1");
        auto response = f.request("GET /mails/m1?k=secret HTTP/1.1");
        REQUIRE(response->status == status::OK);
        REQUIRE(response->content_type == "application/json");
        REQUIRE(nlohmann::json::parse(response->body) == to_json(make_mail("m1")));

        REQUIRE(f.request("GET /mails/missing?k=secret HTTP/1.1")->status == status::NOT_FOUND);
    }

    SECTION("Delete") {
        f.put("m1");
        auto response = f.request("DELETE /mails/m1?k=secret HTTP/1.1");
        REQUIRE(response->serialize() == "HTTP/1.1 200 OK\r\n\r\n");
        REQUIRE_FALSE(f.store->get("m1").has_value());

        REQUIRE(f.request("DELETE /mails/m1?k=secret HTTP/1.1")->status == status::NOT_FOUND);
        REQUIRE(f.request("GET /mails/m1?k=secret HTTP/1.1")->status == status::NOT_FOUND);
    }

    SECTION("List pagination") {
        for (int i = 1; i <= 9; ++i) {
            f.put("m" + std::to_string(i));
        }
        f.put("m9z");

        auto response = f.request("GET /mails?limit=3&offset=5&k=secret HTTP/1.1");
        REQUIRE(response->status == status::OK);
        REQUIRE(ids_of(*response) == std::vector<std::string>{"m6", "m7", "m8"});
    }

    SECTION("List defaults and bounds") {
        for (int i = 0; i < 12; ++i) {
            f.put("m" + std::string(1, static_cast<char>('a' + i)));
        }

        REQUIRE(ids_of(*f.request("GET /mails?k=secret")).size() == MailHandlers::DEFAULT_LIMIT);
        REQUIRE(ids_of(*f.request("GET /mails?k=secret&offset=10")) == std::vector<std::string>{"mk", "ml"});
        REQUIRE(ids_of(*f.request("GET /mails?k=secret&offset=50")).empty());
        REQUIRE(ids_of(*f.request("GET /mails?k=secret&limit=0")).empty());
    }

    SECTION("List of four records") {
        for (const char* id : {"a", "b", "c", "d"}) {
            f.put(id);
        }
        REQUIRE(ids_of(*f.request("GET /mails?k=secret")) == std::vector<std::string>{"a", "b", "c", "d"});
    }

    SECTION("Non-numeric pagination") {
        REQUIRE(f.request("GET /mails?limit=abc&k=secret")->status == status::BAD_REQUEST);
        REQUIRE(f.request("GET /mails?offset=-1&k=secret")->status == status::BAD_REQUEST);
        REQUIRE(f.request("GET /mails?limit=&k=secret")->status == status::BAD_REQUEST);
    }

    SECTION("Corrupt record fails the listing by default") {
        f.put("a");
        f.put_garbage("b");
        f.put("c");

        auto response = f.request("GET /mails?k=secret");
        REQUIRE(response->serialize() == "HTTP/1.1 500 Internal Server Error\r\n\r\n");

        REQUIRE(f.request("GET /mails/b?k=secret")->status == status::INTERNAL_ERROR);
        REQUIRE(f.request("GET /mails/a?k=secret")->status == status::OK);
    }
}

TEST_CASE("Request engine skipping corrupt records", "[http][engine]") {
    EngineFixture f(CorruptRecordPolicy::Skip);
    f.put("a");
    f.put_garbage("b");
    f.put("c");
    f.put("d");

    REQUIRE(ids_of(*f.request("GET /mails?k=secret&limit=2")) == std::vector<std::string>{"a", "c"});
    // Offset counts stored entries, corrupt ones included
    REQUIRE(ids_of(*f.request("GET /mails?k=secret&offset=1")) == std::vector<std::string>{"c", "d"});
}
