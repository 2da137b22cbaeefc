/**
 * @file device_identity.hpp
 * @brief Per-installation device id and signing key pair.
 *
 * The identity is created once, persisted through the settings store under
 * "deviceInfo", and loaded on every later run. The key pair is generated and
 * kept but not yet used to authenticate sync payloads.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include "ktnsync/core/interfaces/istore.hpp"

typedef struct evp_pkey_st EVP_PKEY;

namespace ktnsync {

    /**
     * @class DeviceKeyPair
     * @brief Owning wrapper around an ECDSA P-256 key pair.
     */
    class DeviceKeyPair {
    public:
        /**
         * @brief Generate a fresh P-256 key pair.
         * @throws SyncError(Internal) on an OpenSSL failure
         */
        static DeviceKeyPair generate();

        /**
         * @brief Import from the exported base64 forms.
         * @throws SyncError(IdentityStore) if either key does not decode or the curve is not P-256
         */
        static DeviceKeyPair import(const std::string& publicKeyB64, const std::string& privateKeyB64);

        DeviceKeyPair(DeviceKeyPair&&) noexcept = default;
        DeviceKeyPair& operator=(DeviceKeyPair&&) noexcept = default;
        ~DeviceKeyPair() = default;

        /// Base64 DER SubjectPublicKeyInfo.
        std::string exportPublicKey() const;
        /// Base64 DER PKCS#8 PrivateKeyInfo.
        std::string exportPrivateKey() const;

        EVP_PKEY* publicKey() const { return pub_.get(); }
        EVP_PKEY* privateKey() const { return priv_.get(); }

    private:
        struct KeyDeleter { void operator()(EVP_PKEY* k) const noexcept; };
        using KeyPtr = std::unique_ptr<EVP_PKEY, KeyDeleter>;

        DeviceKeyPair(KeyPtr pub, KeyPtr priv) : pub_(std::move(pub)), priv_(std::move(priv)) {}

        KeyPtr pub_;
        KeyPtr priv_;
    };

    /**
     * @struct DeviceIdentity
     * @brief Persisted identity record.
     */
    struct DeviceIdentity {
        std::string deviceId;   ///< 32 lowercase hex characters (128 bits)
        std::string publicKey;  ///< Base64 SPKI
        std::string privateKey; ///< Base64 PKCS#8
        std::string createdAt;  ///< ISO-8601
    };

    /**
     * @class DeviceIdentityManager
     * @brief Loads or creates the device identity through an ISettingsStore.
     */
    class DeviceIdentityManager {
    public:
        static constexpr const char* kSettingKey = "deviceInfo";

        explicit DeviceIdentityManager(ISettingsStore& settings);
        ~DeviceIdentityManager();

        /**
         * @brief Return the device id, creating and persisting the identity on first use.
         * @throws SyncError(IdentityStore) if the settings store fails
         */
        std::string ensureIdentity();

        /// True once ensureIdentity() has succeeded.
        bool available() const { return identity_.has_value(); }

        const std::optional<DeviceIdentity>& identity() const { return identity_; }

        /// Key pair of the loaded identity, or nullptr.
        const DeviceKeyPair* keys() const { return keys_.get(); }

        /**
         * @brief Forget the identity; the next ensureIdentity() generates a new one.
         * @throws SyncError(IdentityStore) if the settings store fails
         */
        void reset();

    private:
        std::optional<DeviceIdentity> loadStored();

        ISettingsStore&                settings_;
        std::optional<DeviceIdentity>  identity_;
        std::unique_ptr<DeviceKeyPair> keys_;
    };

}
