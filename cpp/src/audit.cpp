#include "warden/audit.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace warden
{

    nlohmann::json AuditEvent::to_json() const
    {
        return nlohmann::json{{"ts", ts},
                              {"actor", actor},
                              {"organization", organization},
                              {"action", action},
                              {"resource", resource},
                              {"resource_id", resource_id},
                              {"result", result},
                              {"details", details}};
    }

    AuditEvent AuditEvent::from_context(const AuthContext &ctx,
                                        std::string action,
                                        std::string resource,
                                        std::string resource_id)
    {
        AuditEvent event;
        event.ts = to_iso8601(now_ms());
        event.actor = ctx.user.id;
        event.organization = ctx.organization.id;
        event.action = std::move(action);
        event.resource = std::move(resource);
        event.resource_id = std::move(resource_id);
        event.result = "success";
        return event;
    }

    AuditLogger::AuditLogger(bool enabled, const std::string &log_path)
        : enabled_(enabled)
    {
        if (!enabled_)
            return;

        if (log_path.empty())
        {
            logger_ = spdlog::default_logger();
            return;
        }

        try
        {
            logger_ = spdlog::get("audit");
            if (!logger_)
            {
                logger_ = spdlog::basic_logger_mt("audit", log_path);
                logger_->set_pattern("%v");
                logger_->flush_on(spdlog::level::info);
            }
        }
        catch (const spdlog::spdlog_ex &e)
        {
            spdlog::warn("Audit log {} unavailable ({}); using the default logger", log_path, e.what());
            logger_ = spdlog::default_logger();
        }
    }

    void AuditLogger::log(const AuditEvent &event)
    {
        if (!enabled_)
            return;
        logger_->info(event.to_json().dump());
    }

} // namespace warden
