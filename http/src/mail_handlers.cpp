#include "mail_handlers.hpp"
#include "mail_json.hpp"
#include "logger.hpp"
#include <charconv>

namespace mailcatch::http {

namespace {

// Decimal digits only; absent parameters take the default
std::optional<size_t> numeric_param(const Request& request, const std::string& name, size_t fallback) {
    auto value = request.query_value(name);
    if (!value) {
        return fallback;
    }

    size_t result = 0;
    const char* first = value->data();
    const char* last = first + value->size();
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec != std::errc() || ptr != last || value->empty()) {
        return std::nullopt;
    }
    return result;
}

}  // namespace

MailHandlers::MailHandlers(std::shared_ptr<MailStore> store, CorruptRecordPolicy corrupt_records)
    : store_(std::move(store))
    , corrupt_records_(corrupt_records) {
}

void MailHandlers::register_routes(Router& router) {
    router.add(Method::Get, "/mails/:mail_id", [this](const Request& req) { return get_mail(req); });
    router.add(Method::Delete, "/mails/:mail_id", [this](const Request& req) { return delete_mail(req); });
    router.add(Method::Get, "/mails", [this](const Request& req) { return list_mails(req); });
}

Response MailHandlers::get_mail(const Request& request) {
    auto id = request.param("mail_id").value_or("");

    auto mail = store_->get(id);
    if (!mail) {
        return Response::empty(status::NOT_FOUND);
    }
    return Response::json(to_json(*mail));
}

Response MailHandlers::delete_mail(const Request& request) {
    auto id = request.param("mail_id").value_or("");

    switch (store_->remove(id)) {
        case RemoveResult::Removed:
            LOG_INFO_FMT("Deleted mail {}", id);
            return Response::empty(status::OK);
        case RemoveResult::Missing:
            return Response::empty(status::NOT_FOUND);
        case RemoveResult::Failed:
            LOG_WARNING_FMT("Delete of {} failed: {}", id, store_->last_error());
            return Response::empty(status::NOT_FOUND);
    }
    return Response::empty(status::NOT_FOUND);
}

Response MailHandlers::list_mails(const Request& request) {
    auto limit = numeric_param(request, "limit", DEFAULT_LIMIT);
    auto offset = numeric_param(request, "offset", 0);
    if (!limit || !offset) {
        return Response::empty(status::BAD_REQUEST);
    }

    auto mails = nlohmann::json::array();
    if (*limit == 0) {
        return Response::json(mails);
    }

    store_->iterate(*offset, [&](const std::string& id, const std::string& encoded) {
        auto mail = Mail::deserialize(encoded);
        if (!mail) {
            if (corrupt_records_ == CorruptRecordPolicy::FailFast) {
                LOG_ERROR_FMT("Listing aborted: stored value for {} does not decode", id);
                throw CorruptRecordError(id);
            }
            LOG_WARNING_FMT("Skipping undecodable record {}", id);
            return true;
        }

        mails.push_back(to_json(*mail));
        return mails.size() < *limit;
    });

    return Response::json(mails);
}

}  // namespace mailcatch::http
