#include "warden/web_server.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <functional>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace warden
{
    namespace
    {
        HttpResponse json_response(http::status status, const json &body, unsigned version)
        {
            HttpResponse res{status, version};
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            res.set(http::field::content_type, "application/json");
            res.body() = body.dump();
            res.prepare_payload();
            return res;
        }

        std::vector<std::string_view> path_segments(std::string_view target)
        {
            if (auto q = target.find('?'); q != std::string_view::npos)
                target = target.substr(0, q);

            std::vector<std::string_view> out;
            while (!target.empty())
            {
                if (target.front() == '/')
                {
                    target.remove_prefix(1);
                    continue;
                }
                auto slash = target.find('/');
                out.push_back(target.substr(0, slash));
                if (slash == std::string_view::npos)
                    break;
                target.remove_prefix(slash);
            }
            return out;
        }

        Result<json> parse_body(const HttpRequest &req)
        {
            if (req.body().empty())
                return json::object();
            auto j = json::parse(req.body(), nullptr, false);
            if (j.is_discarded() || !j.is_object())
                return std::unexpected(WardenError::invalid_input("Invalid JSON body"));
            return j;
        }

        std::optional<std::string> string_field(const json &body, const char *name)
        {
            auto it = body.find(name);
            if (it == body.end() || !it->is_string() || it->get_ref<const std::string &>().empty())
                return std::nullopt;
            return it->get<std::string>();
        }

        Result<std::optional<int>> expires_field(const json &body)
        {
            auto it = body.find("expiresInDays");
            if (it == body.end() || it->is_null())
                return std::optional<int>{};
            if (!it->is_number_integer())
                return std::unexpected(WardenError::invalid_input("expiresInDays must be an integer"));

            // Read at full width; narrowing must not wrap.
            bool in_range = it->is_number_unsigned()
                                ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                                : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                                      it->get<std::int64_t>() <= std::numeric_limits<int>::max();
            if (!in_range)
                return std::unexpected(WardenError::invalid_input("expiresInDays is out of range"));
            return std::optional<int>{static_cast<int>(it->get<std::int64_t>())};
        }

        Result<LicenseFeatures> features_field(const json &body)
        {
            auto it = body.find("features");
            if (it == body.end() || it->is_null())
                return default_license_features();
            return LicenseFeatures::from_json(*it);
        }

        json license_view(const License &license)
        {
            json j = license.to_json();
            j.erase("signature");
            return j;
        }

        json validation_view(const LicenseValidation &v)
        {
            json j{{"valid", v.valid}};
            if (v.reason)
                j["reason"] = *v.reason;
            if (v.code)
                j["code"] = std::string(error_code_name(*v.code));
            if (v.payload)
                j["payload"] = v.payload->to_json();
            if (v.license)
                j["license"] = license_view(*v.license);
            return j;
        }

        class Handler
        {
        public:
            Handler(const Services &s, const HttpRequest &req, std::stop_token stop)
                : s_(s), req_(req), stop_(std::move(stop))
            {
            }

            HttpResponse dispatch()
            {
                auto target = req_.target();
                auto seg = path_segments(std::string_view(target.data(), target.size()));
                auto method = req_.method();

                if (seg.size() == 1 && seg[0] == "health" && method == http::verb::get)
                    return ok({{"status", "ok"}, {"timestamp", to_iso8601(now_ms())}});

                if (seg.empty() || seg[0] != "api")
                    return not_found();

                if (seg.size() == 3 && seg[1] == "auth" && seg[2] == "login" && method == http::verb::post)
                    return login();
                if (seg.size() == 2 && seg[1] == "me" && method == http::verb::get)
                    return me();
                if (seg.size() == 2 && seg[1] == "companies" && method == http::verb::post)
                    return create_company();
                if (seg.size() == 4 && seg[1] == "companies" && method == http::verb::post)
                    return company_action(std::string(seg[2]), seg[3]);
                if (seg.size() == 2 && seg[1] == "tenants" && method == http::verb::post)
                    return create_tenant();
                if (seg.size() == 2 && seg[1] == "users" && method == http::verb::post)
                    return create_user();
                if (seg.size() == 2 && seg[1] == "licenses" && method == http::verb::post)
                    return create_license();
                if (seg.size() == 4 && seg[1] == "licenses" && method == http::verb::post)
                    return license_action(std::string(seg[2]), seg[3]);
                if (seg.size() == 4 && seg[1] == "users" && seg[3] == "roles" && method == http::verb::post)
                    return assign_role(std::string(seg[2]));
                if (seg.size() == 5 && seg[1] == "users" && seg[3] == "roles" && method == http::verb::delete_)
                    return remove_role(std::string(seg[2]), std::string(seg[4]));

                return not_found();
            }

        private:
            HttpResponse ok(const json &body, http::status status = http::status::ok)
            {
                return json_response(status, body, req_.version());
            }

            HttpResponse fail(const WardenError &e)
            {
                return error_response(e, req_.version());
            }

            HttpResponse not_found()
            {
                return json_response(http::status::not_found, {{"error", "Route not found"}}, req_.version());
            }

            Result<AuthContextPtr> authenticate()
            {
                AuthRequest auth;
                if (auto h = req_.find(http::field::authorization); h != req_.end())
                    auth.authorization = std::string(h->value());
                return s_.pipeline->authenticate(auth, stop_);
            }

            void audit(const AuthContext &ctx, std::string action, std::string resource,
                       std::string resource_id, json details = json::object())
            {
                auto event = AuditEvent::from_context(ctx, std::move(action), std::move(resource), std::move(resource_id));
                event.details = std::move(details);
                s_.audit->log(event);
            }

            HttpResponse login()
            {
                auto body = parse_body(req_);
                if (!body)
                    return fail(body.error());
                auto email = string_field(*body, "email");
                auto password = string_field(*body, "password");
                if (!email || !password)
                    return fail(WardenError::invalid_input("Email and password are required"));

                auto result = s_.accounts->login(*email, *password);
                if (!result)
                    return fail(result.error());
                return ok({{"token", result->token}, {"user", result->user.to_public_json()}});
            }

            HttpResponse me()
            {
                auto ctx = authenticate();
                if (!ctx)
                    return fail(ctx.error());
                return ok((*ctx)->to_json());
            }

            HttpResponse create_company()
            {
                auto ctx = authenticate();
                if (!ctx)
                    return fail(ctx.error());
                if (auto g = SuperIdentityGuard{}.check(**ctx); !g)
                    return fail(g.error());

                auto body = parse_body(req_);
                if (!body)
                    return fail(body.error());
                auto name = string_field(*body, "name");
                auto domain = string_field(*body, "domain");
                if (!name || !domain)
                    return fail(WardenError::invalid_input("Missing required fields: name and domain"));
                auto features = features_field(*body);
                if (!features)
                    return fail(features.error());
                auto expires = expires_field(*body);
                if (!expires)
                    return fail(expires.error());

                auto created = s_.accounts->create_organization(*name, *domain, *features, *expires);
                if (!created)
                    return fail(created.error());

                audit(**ctx, "company.create", "company", created->organization.id, {{"domain", *domain}});
                return ok({{"message", "Company created successfully"},
                           {"company", created->organization.to_json()},
                           {"licenseKey", created->license.license_key},
                           {"rolesSeeded", created->roles_seeded}},
                          http::status::created);
            }

            HttpResponse company_action(const std::string &company_id, std::string_view action)
            {
                if (action != "block" && action != "unblock" && action != "default-roles")
                    return not_found();

                auto ctx = authenticate();
                if (!ctx)
                    return fail(ctx.error());
                if (auto g = SuperIdentityGuard{}.check(**ctx); !g)
                    return fail(g.error());

                if (action == "default-roles")
                {
                    auto roles = s_.accounts->seed_default_roles(company_id);
                    if (!roles)
                        return fail(roles.error());
                    auto created = json::array();
                    for (const auto &role : *roles)
                        created.push_back(role.to_json());
                    audit(**ctx, "company.seed_roles", "company", company_id, {{"created", roles->size()}});
                    return ok({{"message", "Default roles seeded"}, {"roles", std::move(created)}});
                }

                auto body = parse_body(req_);
                if (!body)
                    return fail(body.error());

                auto reason = string_field(*body, "reason");
                auto org = action == "block" ? s_.accounts->block_organization(company_id, reason)
                                             : s_.accounts->unblock_organization(company_id);
                if (!org)
                    return fail(org.error());

                json details = json::object();
                if (reason && action == "block")
                    details["reason"] = *reason;
                audit(**ctx, "company." + std::string(action), "company", company_id, std::move(details));
                return ok({{"message", action == "block" ? "Company blocked successfully" : "Company unblocked successfully"},
                           {"company", org->to_json()}});
            }

            HttpResponse create_tenant()
            {
                auto ctx = authenticate();
                if (!ctx)
                    return fail(ctx.error());
                if (auto g = OrgAdminGuard{}.check(**ctx); !g)
                    return fail(g.error());

                auto body = parse_body(req_);
                if (!body)
                    return fail(body.error());
                auto name = string_field(*body, "name");
                if (!name)
                    return fail(WardenError::invalid_input("Tenant name is required"));
                json settings = json::object();
                if (auto it = body->find("settings"); it != body->end() && !it->is_null())
                    settings = *it;

                auto tenant = s_.accounts->create_tenant((*ctx)->organization.id, *name, std::move(settings));
                if (!tenant)
                    return fail(tenant.error());

                audit(**ctx, "tenant.create", "tenant", tenant->id, {{"name", *name}});
                return ok(tenant->to_json(), http::status::created);
            }

            HttpResponse create_user()
            {
                auto ctx = authenticate();
                if (!ctx)
                    return fail(ctx.error());
                if (auto g = PermissionGuard("user.create").check(**ctx); !g)
                    return fail(g.error());

                auto body = parse_body(req_);
                if (!body)
                    return fail(body.error());
                auto email = string_field(*body, "email");
                auto password = string_field(*body, "password");
                auto full_name = string_field(*body, "fullName");
                if (!email || !password || !full_name)
                    return fail(WardenError::invalid_input("Missing required fields"));

                NewUser request;
                request.email = *email;
                request.password = *password;
                request.full_name = *full_name;
                request.company_id = (*ctx)->organization.id;
                request.tenant_id = string_field(*body, "tenantId");
                if (auto it = body->find("isOrgAdmin"); it != body->end() && it->is_boolean())
                    request.is_org_admin = it->get<bool>();

                auto user = s_.accounts->register_user(request);
                if (!user)
                    return fail(user.error());

                audit(**ctx, "user.create", "user", user->id, {{"email", user->email}, {"fullName", user->full_name}});
                return ok({{"message", "User created successfully"}, {"userId", user->id}}, http::status::created);
            }

            HttpResponse create_license()
            {
                auto ctx = authenticate();
                if (!ctx)
                    return fail(ctx.error());
                if (auto g = SuperIdentityGuard{}.check(**ctx); !g)
                    return fail(g.error());

                auto body = parse_body(req_);
                if (!body)
                    return fail(body.error());
                auto company_id = string_field(*body, "companyId");
                if (!company_id)
                    return fail(WardenError::invalid_input("Missing required field: companyId"));
                auto features = features_field(*body);
                if (!features)
                    return fail(features.error());
                auto expires = expires_field(*body);
                if (!expires)
                    return fail(expires.error());

                auto org = s_.store->find_organization(*company_id);
                if (!org)
                    return fail(org.error());
                if (!org->has_value())
                    return fail(WardenError::not_found("Company not found"));

                auto key = s_.licenses->generate((*org)->id, (*org)->name, *features, *expires);
                if (!key)
                    return fail(key.error());

                audit(**ctx, "license.create", "license", *company_id);
                return ok({{"message", "License generated successfully"}, {"licenseKey", *key}},
                          http::status::created);
            }

            HttpResponse license_action(const std::string &license_id, std::string_view action)
            {
                auto ctx = authenticate();
                if (!ctx)
                    return fail(ctx.error());
                if (auto g = SuperIdentityGuard{}.check(**ctx); !g)
                    return fail(g.error());

                if (action == "validate")
                {
                    auto license = s_.licenses->find(license_id);
                    if (!license)
                        return fail(license.error());
                    return ok(validation_view(s_.licenses->validate(license->license_key)));
                }

                if (action != "revoke" && action != "suspend" && action != "reactivate")
                    return not_found();

                auto updated = action == "revoke"    ? s_.licenses->revoke(license_id)
                               : action == "suspend" ? s_.licenses->suspend(license_id)
                                                     : s_.licenses->reactivate(license_id);
                if (!updated)
                    return fail(updated.error());

                audit(**ctx, "license." + std::string(action), "license", license_id);
                return ok({{"message", "License updated"}, {"license", license_view(*updated)}});
            }

            /** Role must belong to the caller's organization unless the caller is the super-identity. */
            Result<Role> role_in_scope(const AuthContext &ctx, const std::string &role_id)
            {
                auto role = s_.store->find_role(role_id);
                if (!role)
                    return std::unexpected(role.error());
                if (!role->has_value())
                    return std::unexpected(WardenError::not_found("Role not found"));
                if (!ctx.user.is_super_user && (*role)->company_id != ctx.organization.id)
                    return std::unexpected(WardenError::forbidden("Role belongs to another organization"));
                return **role;
            }

            HttpResponse assign_role(const std::string &user_id)
            {
                auto ctx = authenticate();
                if (!ctx)
                    return fail(ctx.error());
                if (auto g = PermissionGuard("role.assign").check(**ctx); !g)
                    return fail(g.error());

                auto body = parse_body(req_);
                if (!body)
                    return fail(body.error());
                auto role_id = string_field(*body, "roleId");
                if (!role_id)
                    return fail(WardenError::invalid_input("Missing required field: roleId"));

                auto role = role_in_scope(**ctx, *role_id);
                if (!role)
                    return fail(role.error());

                auto target = s_.store->find_user(user_id);
                if (!target)
                    return fail(target.error());
                if (!target->has_value())
                    return fail(WardenError::not_found("User not found"));

                if (auto res = s_.permissions->assign_role(user_id, *role_id, (*ctx)->user.id); !res)
                    return fail(res.error());

                audit(**ctx, "role.assign", "user", user_id, {{"roleId", *role_id}});
                return ok({{"message", "Role assigned successfully"}}, http::status::created);
            }

            HttpResponse remove_role(const std::string &user_id, const std::string &role_id)
            {
                auto ctx = authenticate();
                if (!ctx)
                    return fail(ctx.error());
                if (auto g = PermissionGuard("role.assign").check(**ctx); !g)
                    return fail(g.error());

                auto role = role_in_scope(**ctx, role_id);
                if (!role)
                    return fail(role.error());

                if (auto res = s_.permissions->remove_role(user_id, role_id); !res)
                    return fail(res.error());

                audit(**ctx, "role.remove", "user", user_id, {{"roleId", role_id}});
                return ok({{"message", "Role removed successfully"}});
            }

            const Services &s_;
            const HttpRequest &req_;
            std::stop_token stop_;
        };
    } // namespace

    unsigned status_for(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::Unauthenticated:
            return 401;
        case ErrorCode::Forbidden:
        case ErrorCode::Expired:
        case ErrorCode::Suspended:
        case ErrorCode::Revoked:
        case ErrorCode::SignatureMismatch:
        case ErrorCode::DecryptionFailed:
            return 403;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::Conflict:
            return 409;
        case ErrorCode::InvalidInput:
        case ErrorCode::InvalidFormat:
            return 400;
        case ErrorCode::Cancelled:
            return 499;
        default:
            return 500;
        }
    }

    HttpResponse error_response(const WardenError &error, unsigned version)
    {
        auto status = status_for(error.code);
        json body{{"error", status == 500 ? std::string("Internal server error") : std::string(error.what())}};
        if (error.reason)
            body["reason"] = *error.reason;
        if (error.required)
            body["required"] = *error.required;
        if (status == 500)
            spdlog::error("Request failed ({}): {}", error_code_name(error.code), error.what());
        return json_response(static_cast<http::status>(status), body, version);
    }

    ApiRouter::ApiRouter(std::shared_ptr<const Services> services)
        : services_(std::move(services))
    {
    }

    HttpResponse ApiRouter::handle(const HttpRequest &req, std::stop_token stop) const
    {
        try
        {
            return Handler(*services_, req, std::move(stop)).dispatch();
        }
        catch (const std::exception &e)
        {
            return error_response(WardenError::internal(e.what()), req.version());
        }
    }

    class WebServer::Impl
    {
    public:
        Impl(const WebServerConfig &cfg, std::shared_ptr<const Services> services)
            : cfg_(cfg),
              ioc_(static_cast<int>(cfg.threads)),
              acceptor_(ioc_),
              router_(std::move(services)),
              workers_(cfg.threads)
        {
        }

        ~Impl()
        {
            stop();
        }

        void run()
        {
            tcp::endpoint endpoint{net::ip::make_address(cfg_.address), cfg_.port};
            beast::error_code ec;

            acceptor_.open(endpoint.protocol(), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.bind(endpoint, ec);
            if (ec)
                throw beast::system_error{ec};

            acceptor_.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw beast::system_error{ec};

            spdlog::info("Listening on {}:{} with {} thread(s)", cfg_.address, cfg_.port, cfg_.threads);
            do_accept();

            std::vector<std::thread> threads;
            threads.reserve(cfg_.threads);
            for (std::size_t i = 0; i < cfg_.threads; ++i)
            {
                threads.emplace_back([this] { ioc_.run(); });
            }

            for (auto &t : threads)
                t.join();
        }

        void stop()
        {
            shutdown_.request_stop();
            beast::error_code ec;
            acceptor_.cancel(ec);
            acceptor_.close(ec);
            ioc_.stop();
            workers_.stop();
        }

    private:
        void do_accept()
        {
            acceptor_.async_accept(
                net::make_strand(ioc_),
                beast::bind_front_handler(&Impl::on_accept, this));
        }

        void on_accept(beast::error_code ec, tcp::socket socket)
        {
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket), router_, workers_, shutdown_.get_token())->run();
            }
            if (acceptor_.is_open())
                do_accept();
        }

        /**
         * One connection. Requests are handled on the worker pool while the
         * session strand watches the socket; a client that goes away, or a
         * server shutdown, stops the request in flight.
         */
        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket, const ApiRouter &router, net::thread_pool &workers, std::stop_token shutdown)
                : stream_(std::move(socket)),
                  router_(router),
                  workers_(workers),
                  shutdown_(std::move(shutdown))
            {
            }

            void run()
            {
                net::dispatch(stream_.get_executor(),
                              beast::bind_front_handler(&Session::do_read, shared_from_this()));
            }

        private:
            using ShutdownCallback = std::stop_callback<std::function<void()>>;

            void do_read()
            {
                req_ = {};
                stream_.expires_after(std::chrono::seconds(30));
                http::async_read(stream_, buffer_, req_,
                                 beast::bind_front_handler(&Session::on_read, shared_from_this()));
            }

            void on_read(beast::error_code ec, std::size_t)
            {
                if (ec == http::error::end_of_stream)
                {
                    return do_close();
                }
                if (ec)
                {
                    spdlog::debug("Read failed: {}", ec.message());
                    return;
                }

                auto request_stop = std::make_shared<std::stop_source>();
                auto on_shutdown = std::make_shared<ShutdownCallback>(
                    shutdown_, std::function<void()>([request_stop] { request_stop->request_stop(); }));
                watch_disconnect(request_stop);

                auto self = shared_from_this();
                auto started = std::chrono::steady_clock::now();
                net::post(workers_, [self, request_stop, on_shutdown, started] {
                    auto res = self->router_.handle(self->req_, request_stop->get_token());
                    net::post(self->stream_.get_executor(), [self, res = std::move(res), started]() mutable {
                        self->on_handled(std::move(res), started);
                    });
                });
            }

            /** A readable socket with nothing to read means the peer closed. */
            void watch_disconnect(std::shared_ptr<std::stop_source> request_stop)
            {
                stream_.socket().async_wait(
                    tcp::socket::wait_read,
                    [self = shared_from_this(), request_stop](beast::error_code ec) {
                        if (ec)
                            return; // cancelled once the response is ready
                        char byte;
                        beast::error_code peek_ec;
                        auto n = self->stream_.socket().receive(net::buffer(&byte, 1), tcp::socket::message_peek, peek_ec);
                        if (peek_ec || n == 0)
                        {
                            spdlog::debug("Client disconnected mid-request");
                            request_stop->request_stop();
                        }
                    });
            }

            void on_handled(HttpResponse res, std::chrono::steady_clock::time_point started)
            {
                beast::error_code ec;
                stream_.socket().cancel(ec);

                res_ = std::move(res);
                res_.keep_alive(req_.keep_alive());
                spdlog::debug("{} {} -> {} ({} ms)",
                              std::string(req_.method_string()),
                              std::string(req_.target()),
                              res_.result_int(),
                              std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - started)
                                  .count());
                do_write();
            }

            void do_write()
            {
                auto self = shared_from_this();
                stream_.expires_after(std::chrono::seconds(30));
                http::async_write(stream_, res_,
                                  [self](beast::error_code ec, std::size_t) {
                                      self->on_write(ec);
                                  });
            }

            void on_write(beast::error_code ec)
            {
                if (ec)
                {
                    spdlog::debug("Write failed: {}", ec.message());
                    return;
                }
                if (!res_.keep_alive())
                    return do_close();
                do_read();
            }

            void do_close()
            {
                beast::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            }

            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            HttpRequest req_;
            HttpResponse res_;
            const ApiRouter &router_;
            net::thread_pool &workers_;
            std::stop_token shutdown_;
        };

        WebServerConfig cfg_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        ApiRouter router_;
        std::stop_source shutdown_;
        net::thread_pool workers_;
    };

    WebServer::WebServer(const WebServerConfig &cfg, std::shared_ptr<const Services> services)
        : impl_(std::make_unique<Impl>(cfg, std::move(services)))
    {
    }

    WebServer::~WebServer() = default;

    void WebServer::run() { impl_->run(); }
    void WebServer::stop() { impl_->stop(); }

} // namespace warden
