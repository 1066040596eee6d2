#pragma once

#include "license_codec.hpp"
#include "model.hpp"
#include "store.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace warden
{

    /**
     * Outcome of license validation. `license` is filled whenever a stored
     * row was found (including revoked/suspended/expired), `payload` only on
     * success. `code` and `reason` describe the first failed check.
     */
    struct LicenseValidation
    {
        bool valid{false};
        std::optional<License> license;
        std::optional<LicensePayload> payload;
        std::optional<ErrorCode> code;
        std::optional<std::string> reason;
    };

    /** Allowed status transitions: revoked and expired are terminal. */
    bool can_transition(LicenseStatus from, LicenseStatus to);

    /**
     * Issues, validates and transitions licenses.
     *
     * State machine:
     *   active    -> suspended | revoked | expired
     *   suspended -> active | revoked
     *   revoked, expired: terminal
     */
    class LicenseManager
    {
    public:
        using Clock = std::function<Timestamp()>;

        LicenseManager(std::shared_ptr<Store> store,
                       std::shared_ptr<const LicenseCodec> codec,
                       Clock clock = now_ms);

        /**
         * Build and encode a license without persisting it.
         * Used where the license must be stored together with other rows.
         */
        Result<License> issue(const std::string &company_id,
                              const std::string &company_name,
                              const LicenseFeatures &features,
                              std::optional<int> expires_in_days = std::nullopt) const;

        /**
         * Issue a license, persist it as active and make it the
         * organization's current license. Returns the opaque key.
         */
        Result<std::string> generate(const std::string &company_id,
                                     const std::string &company_name,
                                     const LicenseFeatures &features,
                                     std::optional<int> expires_in_days = std::nullopt);

        LicenseValidation validate(const std::string &license_key);

        Result<License> revoke(const std::string &license_id);
        Result<License> suspend(const std::string &license_id);
        Result<License> reactivate(const std::string &license_id);

        Result<License> find(const std::string &license_id);

        /** The active license of an organization, if any. */
        Result<std::optional<License>> current_for_organization(const std::string &company_id);

        /**
         * Read-path transition active -> expired. Idempotent: returns false
         * when the license was already moved by another caller.
         */
        Result<bool> expire_if_due(const License &license, const LicensePayload &payload);

    private:
        Result<License> transition(const std::string &license_id, LicenseStatus target);

        std::shared_ptr<Store> store_;
        std::shared_ptr<const LicenseCodec> codec_;
        Clock clock_;
    };

} // namespace warden
