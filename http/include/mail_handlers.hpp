#pragma once

#include "http_router.hpp"
#include "config.hpp"
#include "storage/mail_store.hpp"
#include <memory>

namespace mailcatch::http {

class MailHandlers {
public:
    static constexpr size_t DEFAULT_LIMIT = 10;

    MailHandlers(std::shared_ptr<MailStore> store, CorruptRecordPolicy corrupt_records);

    // GET /mails/:mail_id, DELETE /mails/:mail_id, GET /mails
    void register_routes(Router& router);

    Response get_mail(const Request& request);
    Response delete_mail(const Request& request);
    // ?limit=N&offset=M; offset skips stored entries, limit caps the decoded records returned
    Response list_mails(const Request& request);

private:
    std::shared_ptr<MailStore> store_;
    CorruptRecordPolicy corrupt_records_;
};

}  // namespace mailcatch::http
