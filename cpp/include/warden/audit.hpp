#pragma once

#include "auth_pipeline.hpp"
#include "types.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace spdlog
{
    class logger;
}

namespace warden
{
    struct AuditEvent
    {
        std::string ts;
        std::string actor;        // user id
        std::string organization; // actor's company id
        std::string action;       // e.g. license.revoke
        std::string resource;
        std::string resource_id;
        std::string result;       // success | failure
        nlohmann::json details = nlohmann::json::object();

        nlohmann::json to_json() const;

        /** Event attributed to the user of an authenticated request. */
        static AuditEvent from_context(const AuthContext &ctx,
                                       std::string action,
                                       std::string resource,
                                       std::string resource_id);
    };

    /**
     * Writes one JSON line per administrative action. Uses a dedicated
     * spdlog logger backed by a file when a path is given, otherwise the
     * default logger.
     */
    class AuditLogger
    {
    public:
        AuditLogger(bool enabled = true, const std::string &log_path = {});

        void log(const AuditEvent &event);

        bool enabled() const { return enabled_; }

    private:
        bool enabled_;
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace warden
