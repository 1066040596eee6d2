#include "warden/cli.hpp"
#include "warden/config.hpp"
#include "warden/rocksdb_store.hpp"
#include "warden/services.hpp"
#include "warden/web_server.hpp"
#include <CLI/CLI.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace warden::cli
{

	namespace
	{
		Result<WardenConfig> load_config(const std::string &path)
		{
			if (path.empty())
				return ConfigLoader::from_env();
			return ConfigLoader::load(path);
		}

		Result<LicenseFeatures> load_features(const std::string &path)
		{
			if (path.empty())
				return default_license_features();

			std::ifstream f(path);
			if (!f.is_open())
				return std::unexpected(WardenError::invalid_input("Unable to open features file: " + path));
			auto j = nlohmann::json::parse(f, nullptr, false);
			if (j.is_discarded())
				return std::unexpected(WardenError::invalid_input("Features file is not valid JSON: " + path));
			return LicenseFeatures::from_json(j);
		}

		std::optional<int> days_or_none(int days)
		{
			if (days == 0)
				return std::nullopt;
			return days;
		}

		int report(const WardenError &e)
		{
			std::cerr << error_code_name(e.code) << ": " << e.what();
			if (e.reason)
				std::cerr << " (" << *e.reason << ")";
			std::cerr << std::endl;
			return e.code == ErrorCode::ConfigError ? 1 : 2;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Warden license and authorization service"};
		app.require_subcommand(1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML (defaults plus environment when omitted)");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");

		std::string su_email;
		std::string su_password;
		auto su_cmd = app.add_subcommand("init-super-user", "Create the system organization and the super user");
		su_cmd->add_option("--email", su_email, "Super user email (overrides config)");
		su_cmd->add_option("--password", su_password, "Super user password (overrides config)");

		std::string company_name;
		std::string company_domain;
		std::string company_features;
		int company_days{0};
		auto company_cmd = app.add_subcommand("create-company", "Create an organization with its license and default roles");
		company_cmd->add_option("--name", company_name, "Company name")->required();
		company_cmd->add_option("--domain", company_domain, "Company email domain")->required();
		company_cmd->add_option("--features", company_features, "Path to license features JSON");
		company_cmd->add_option("--expires-days", company_days, "License lifetime in days (0 = perpetual)")->check(CLI::NonNegativeNumber);

		std::string gen_company;
		std::string gen_features;
		int gen_days{0};
		auto gen_cmd = app.add_subcommand("license-generate", "Issue a new license for an existing company");
		gen_cmd->add_option("--company-id", gen_company, "Company id")->required();
		gen_cmd->add_option("--features", gen_features, "Path to license features JSON");
		gen_cmd->add_option("--expires-days", gen_days, "License lifetime in days (0 = perpetual)")->check(CLI::NonNegativeNumber);

		std::string validate_key;
		auto validate_cmd = app.add_subcommand("license-validate", "Validate a license key against the store");
		validate_cmd->add_option("--key", validate_key, "License key")->required();

		std::optional<std::uint16_t> serve_port;
		std::optional<std::size_t> serve_threads;
		auto serve_cmd = app.add_subcommand("serve", "Run the Warden HTTP server");
		serve_cmd->add_option("--port", serve_port, "Port to bind (overrides config)");
		serve_cmd->add_option("--threads", serve_threads, "Number of worker threads (overrides config)");

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path);
		if (!cfg)
			return report(cfg.error());
		configure_logging(cfg->logging);

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		std::shared_ptr<Store> store;
		try
		{
			store = std::make_shared<RocksDbStore>(cfg->storage);
		}
		catch (const std::runtime_error &e)
		{
			std::cerr << e.what() << std::endl;
			return 1;
		}

		auto services = Services::create(*cfg, store);
		if (!services)
			return report(services.error());

		if (*su_cmd)
		{
			auto email = su_email.empty() ? cfg->super_user.email : su_email;
			auto password = su_password.empty() ? cfg->super_user.password : su_password;
			auto user = services->accounts->initialize_super_identity(email, password);
			if (!user)
				return report(user.error());
			std::cout << "Super user created: " << user->email << " (" << user->id << ")" << std::endl;
			std::cout << "Change the password immediately." << std::endl;
			return 0;
		}

		if (*company_cmd)
		{
			auto features = load_features(company_features);
			if (!features)
				return report(features.error());
			auto created = services->accounts->create_organization(company_name, company_domain, *features, days_or_none(company_days));
			if (!created)
				return report(created.error());
			nlohmann::json out{{"company", created->organization.to_json()},
							   {"licenseId", created->license.id},
							   {"licenseKey", created->license.license_key},
							   {"rolesSeeded", created->roles_seeded}};
			std::cout << out.dump(2) << std::endl;
			return 0;
		}

		if (*gen_cmd)
		{
			auto features = load_features(gen_features);
			if (!features)
				return report(features.error());
			auto org = services->store->find_organization(gen_company);
			if (!org)
				return report(org.error());
			if (!org->has_value())
				return report(WardenError::not_found("Company not found"));
			auto key = services->licenses->generate((*org)->id, (*org)->name, *features, days_or_none(gen_days));
			if (!key)
				return report(key.error());
			std::cout << *key << std::endl;
			return 0;
		}

		if (*validate_cmd)
		{
			auto v = services->licenses->validate(validate_key);
			if (!v.valid)
			{
				std::cerr << "License invalid: " << v.reason.value_or("unknown reason") << std::endl;
				return 2;
			}
			std::cout << "License OK for " << v.payload->company_name;
			if (v.payload->expires_at)
				std::cout << " until " << to_iso8601(*v.payload->expires_at);
			std::cout << std::endl;
			return 0;
		}

		if (*serve_cmd)
		{
			WebServerConfig wsc{cfg->server.address,
								serve_port.value_or(cfg->server.port),
								serve_threads.value_or(cfg->server.threads)};
			auto shared = std::make_shared<const Services>(std::move(*services));
			WebServer server(wsc, shared);
			server.run();
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace warden::cli
