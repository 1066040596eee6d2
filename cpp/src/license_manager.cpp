#include "warden/license_manager.hpp"
#include "warden/crypto.hpp"
#include <format>
#include <spdlog/spdlog.h>

namespace warden
{

    namespace
    {
        constexpr int kMaxTransitionAttempts = 3;

        std::string_view verb_for(LicenseStatus target)
        {
            switch (target)
            {
            case LicenseStatus::Active:
                return "reactivate";
            case LicenseStatus::Suspended:
                return "suspend";
            case LicenseStatus::Revoked:
                return "revoke";
            case LicenseStatus::Expired:
                return "expire";
            }
            return "transition";
        }

        LicenseValidation rejected(ErrorCode code, std::string reason, std::optional<License> license = std::nullopt)
        {
            LicenseValidation v;
            v.valid = false;
            v.code = code;
            v.reason = std::move(reason);
            v.license = std::move(license);
            return v;
        }
    } // namespace

    bool can_transition(LicenseStatus from, LicenseStatus to)
    {
        switch (from)
        {
        case LicenseStatus::Active:
            return to == LicenseStatus::Suspended || to == LicenseStatus::Revoked || to == LicenseStatus::Expired;
        case LicenseStatus::Suspended:
            return to == LicenseStatus::Active || to == LicenseStatus::Revoked;
        case LicenseStatus::Revoked:
        case LicenseStatus::Expired:
            return false;
        }
        return false;
    }

    LicenseManager::LicenseManager(std::shared_ptr<Store> store,
                                   std::shared_ptr<const LicenseCodec> codec,
                                   Clock clock)
        : store_(std::move(store)), codec_(std::move(codec)), clock_(std::move(clock))
    {
    }

    Result<License> LicenseManager::issue(const std::string &company_id,
                                          const std::string &company_name,
                                          const LicenseFeatures &features,
                                          std::optional<int> expires_in_days) const
    {
        if (company_id.empty())
        {
            return std::unexpected(WardenError::invalid_input("Company id is required"));
        }
        if (expires_in_days && *expires_in_days < 0)
        {
            return std::unexpected(WardenError::invalid_input("expiresInDays must not be negative"));
        }

        LicensePayload payload;
        payload.company_id = company_id;
        payload.company_name = company_name;
        payload.features = features;
        payload.issued_at = clock_();
        // Zero days means perpetual, like an absent value.
        if (expires_in_days && *expires_in_days > 0)
        {
            payload.expires_at = payload.issued_at + std::chrono::days{*expires_in_days};
        }
        payload.nonce = crypto::SecureRandom::uuid_v4();

        auto key = codec_->encode(payload);
        if (!key)
            return std::unexpected(key.error());

        License license;
        license.id = crypto::SecureRandom::uuid_v4();
        license.company_id = company_id;
        license.license_key = *key;
        license.status = LicenseStatus::Active;
        license.features = features;
        license.issued_at = payload.issued_at;
        license.expires_at = payload.expires_at;
        license.signature = codec_->sign(license.license_key);
        return license;
    }

    Result<std::string> LicenseManager::generate(const std::string &company_id,
                                                 const std::string &company_name,
                                                 const LicenseFeatures &features,
                                                 std::optional<int> expires_in_days)
    {
        auto license = issue(company_id, company_name, features, expires_in_days);
        if (!license)
            return std::unexpected(license.error());

        if (auto res = store_->insert_license(*license); !res)
        {
            spdlog::error("Failed to store license for company {}: {}", company_id, res.error().what());
            return std::unexpected(res.error());
        }

        spdlog::info("Generated license {} for company {} (expires: {})",
                     license->id,
                     company_id,
                     license->expires_at ? to_iso8601(*license->expires_at) : std::string("never"));
        return license->license_key;
    }

    LicenseValidation LicenseManager::validate(const std::string &license_key)
    {
        auto payload = codec_->decode(license_key);
        if (!payload)
        {
            spdlog::warn("License rejected by codec: {}", payload.error().what());
            return rejected(payload.error().code, payload.error().what());
        }

        auto found = store_->find_license_by_key(license_key);
        if (!found)
        {
            return rejected(found.error().code,
                            std::format("License validation error: {}", found.error().what()));
        }
        if (!found->has_value())
        {
            return rejected(ErrorCode::NotFound, "License not found in database");
        }

        const License &license = **found;
        switch (license.status)
        {
        case LicenseStatus::Revoked:
            return rejected(ErrorCode::Revoked, "License has been revoked", license);
        case LicenseStatus::Suspended:
            return rejected(ErrorCode::Suspended, "License is suspended", license);
        case LicenseStatus::Expired:
            return rejected(ErrorCode::Expired, "License has expired", license);
        case LicenseStatus::Active:
            break;
        }

        auto expired = expire_if_due(license, *payload);
        if (!expired)
        {
            spdlog::warn("Failed to mark license {} expired: {}", license.id, expired.error().what());
        }
        if (payload->expires_at && clock_() > *payload->expires_at)
        {
            License stale = license;
            stale.status = LicenseStatus::Expired;
            return rejected(ErrorCode::Expired, "License has expired", std::move(stale));
        }

        LicenseValidation ok;
        ok.valid = true;
        ok.license = license;
        ok.payload = std::move(*payload);
        return ok;
    }

    Result<bool> LicenseManager::expire_if_due(const License &license, const LicensePayload &payload)
    {
        if (!payload.expires_at || clock_() <= *payload.expires_at)
            return false;

        auto applied = store_->transition_license(license.id, LicenseStatus::Active, LicenseStatus::Expired, std::nullopt);
        if (!applied)
            return std::unexpected(applied.error());
        if (*applied)
            spdlog::info("License {} expired", license.id);
        return *applied;
    }

    Result<License> LicenseManager::revoke(const std::string &license_id)
    {
        return transition(license_id, LicenseStatus::Revoked);
    }

    Result<License> LicenseManager::suspend(const std::string &license_id)
    {
        return transition(license_id, LicenseStatus::Suspended);
    }

    Result<License> LicenseManager::reactivate(const std::string &license_id)
    {
        return transition(license_id, LicenseStatus::Active);
    }

    Result<License> LicenseManager::find(const std::string &license_id)
    {
        auto row = store_->find_license(license_id);
        if (!row)
            return std::unexpected(row.error());
        if (!row->has_value())
            return std::unexpected(WardenError::not_found("License not found"));
        return **row;
    }

    Result<std::optional<License>> LicenseManager::current_for_organization(const std::string &company_id)
    {
        auto licenses = store_->licenses_for_organization(company_id);
        if (!licenses)
            return std::unexpected(licenses.error());

        std::optional<License> current;
        for (auto &license : *licenses)
        {
            if (license.status != LicenseStatus::Active)
                continue;
            if (!current || license.issued_at > current->issued_at)
                current = std::move(license);
        }
        return current;
    }

    Result<License> LicenseManager::transition(const std::string &license_id, LicenseStatus target)
    {
        for (int attempt = 0; attempt < kMaxTransitionAttempts; ++attempt)
        {
            auto license = find(license_id);
            if (!license)
                return license;

            if (license->status == target)
                return license;

            if (!can_transition(license->status, target))
            {
                return std::unexpected(WardenError::conflict(
                    std::format("Cannot {} a {} license", verb_for(target), license_status_to_string(license->status))));
            }

            std::optional<Timestamp> revoked_at;
            if (target == LicenseStatus::Revoked)
                revoked_at = clock_();

            auto applied = store_->transition_license(license_id, license->status, target, revoked_at);
            if (!applied)
                return std::unexpected(applied.error());
            if (!*applied)
                continue; // status moved underneath us; re-read and re-check

            spdlog::info("License {} {} -> {}",
                         license_id,
                         license_status_to_string(license->status),
                         license_status_to_string(target));
            return find(license_id);
        }

        return std::unexpected(WardenError::conflict("License status changed concurrently"));
    }

} // namespace warden
