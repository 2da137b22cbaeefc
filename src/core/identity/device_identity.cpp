#include "ktnsync/core/identity/device_identity.hpp"
#include "ktnsync/core/util/error_types.hpp"
#include "ktnsync/core/util/hex.hpp"
#include "ktnsync/core/util/logger.hpp"
#include "ktnsync/core/util/time.hpp"
#include "internal/core/util/random.hpp"

#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/x509.h>

#include <cstring>
#include <vector>

namespace ktnsync {

    namespace {
        std::string opensslError(const char* what) {
            unsigned long e = ERR_get_error();
            char buf[256] = { 0 };
            if (e != 0) ERR_error_string_n(e, buf, sizeof(buf));
            return std::string(what) + (e != 0 ? std::string(": ") + buf : std::string{});
        }

        std::string base64Encode(const std::vector<unsigned char>& in) {
            std::string out(4 * ((in.size() + 2) / 3), '\0');
            int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), in.data(),
                                    static_cast<int>(in.size()));
            out.resize(static_cast<size_t>(n));
            return out;
        }

        std::optional<std::vector<unsigned char>> base64Decode(const std::string& in) {
            if (in.empty() || in.size() % 4 != 0) return std::nullopt;
            std::vector<unsigned char> out(in.size() / 4 * 3);
            int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(in.data()),
                                    static_cast<int>(in.size()));
            if (n < 0) return std::nullopt;
            size_t pad = 0;
            if (in[in.size() - 1] == '=') ++pad;
            if (in[in.size() - 2] == '=') ++pad;
            out.resize(static_cast<size_t>(n) - pad);
            return out;
        }

        bool isP256(EVP_PKEY* key) {
            if (EVP_PKEY_get_base_id(key) != EVP_PKEY_EC) return false;
            char name[64] = { 0 };
            size_t len = 0;
            if (EVP_PKEY_get_group_name(key, name, sizeof(name), &len) != 1) return false;
            return std::strcmp(name, SN_X9_62_prime256v1) == 0;
        }
    }

    void DeviceKeyPair::KeyDeleter::operator()(EVP_PKEY* k) const noexcept {
        EVP_PKEY_free(k);
    }

    DeviceKeyPair DeviceKeyPair::generate() {
        std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
            EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), &EVP_PKEY_CTX_free);
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
            EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) != 1)
            throw SyncError(SyncErr::Internal, opensslError("P-256 keygen setup failed"));

        EVP_PKEY* raw = nullptr;
        if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || raw == nullptr)
            throw SyncError(SyncErr::Internal, opensslError("P-256 keygen failed"));

        KeyPtr priv(raw);
        if (EVP_PKEY_up_ref(raw) != 1)
            throw SyncError(SyncErr::Internal, opensslError("EVP_PKEY_up_ref failed"));
        KeyPtr pub(raw);
        return DeviceKeyPair(std::move(pub), std::move(priv));
    }

    DeviceKeyPair DeviceKeyPair::import(const std::string& publicKeyB64, const std::string& privateKeyB64) {
        auto pubDer  = base64Decode(publicKeyB64);
        auto privDer = base64Decode(privateKeyB64);
        if (!pubDer || !privDer)
            throw SyncError(SyncErr::IdentityStore, "stored device keys are not valid base64");

        const unsigned char* p = pubDer->data();
        KeyPtr pub(d2i_PUBKEY(nullptr, &p, static_cast<long>(pubDer->size())));
        if (!pub || !isP256(pub.get()))
            throw SyncError(SyncErr::IdentityStore, opensslError("stored public key is not a P-256 SPKI"));

        const unsigned char* q = privDer->data();
        std::unique_ptr<PKCS8_PRIV_KEY_INFO, decltype(&PKCS8_PRIV_KEY_INFO_free)> p8(
            d2i_PKCS8_PRIV_KEY_INFO(nullptr, &q, static_cast<long>(privDer->size())),
            &PKCS8_PRIV_KEY_INFO_free);
        if (!p8)
            throw SyncError(SyncErr::IdentityStore, opensslError("stored private key is not PKCS#8"));
        KeyPtr priv(EVP_PKCS82PKEY(p8.get()));
        if (!priv || !isP256(priv.get()))
            throw SyncError(SyncErr::IdentityStore, opensslError("stored private key is not P-256"));

        if (EVP_PKEY_eq(pub.get(), priv.get()) != 1)
            throw SyncError(SyncErr::IdentityStore, "stored public and private keys do not match");

        return DeviceKeyPair(std::move(pub), std::move(priv));
    }

    std::string DeviceKeyPair::exportPublicKey() const {
        int len = i2d_PUBKEY(pub_.get(), nullptr);
        if (len <= 0)
            throw SyncError(SyncErr::Internal, opensslError("i2d_PUBKEY failed"));
        std::vector<unsigned char> der(static_cast<size_t>(len));
        unsigned char* p = der.data();
        i2d_PUBKEY(pub_.get(), &p);
        return base64Encode(der);
    }

    std::string DeviceKeyPair::exportPrivateKey() const {
        std::unique_ptr<PKCS8_PRIV_KEY_INFO, decltype(&PKCS8_PRIV_KEY_INFO_free)> p8(
            EVP_PKEY2PKCS8(priv_.get()), &PKCS8_PRIV_KEY_INFO_free);
        if (!p8)
            throw SyncError(SyncErr::Internal, opensslError("EVP_PKEY2PKCS8 failed"));
        int len = i2d_PKCS8_PRIV_KEY_INFO(p8.get(), nullptr);
        if (len <= 0)
            throw SyncError(SyncErr::Internal, opensslError("i2d_PKCS8_PRIV_KEY_INFO failed"));
        std::vector<unsigned char> der(static_cast<size_t>(len));
        unsigned char* p = der.data();
        i2d_PKCS8_PRIV_KEY_INFO(p8.get(), &p);
        return base64Encode(der);
    }

    DeviceIdentityManager::DeviceIdentityManager(ISettingsStore& settings)
        : settings_(settings) {}

    DeviceIdentityManager::~DeviceIdentityManager() = default;

    std::optional<DeviceIdentity> DeviceIdentityManager::loadStored() {
        auto stored = settings_.getSetting(kSettingKey);
        if (!stored) return std::nullopt;

        const auto& j = *stored;
        if (!j.is_object() || !j.contains("id") || !j["id"].is_string() ||
            !isHex128(j["id"].get<std::string>()) ||
            !j.contains("publicKey") || !j["publicKey"].is_string() ||
            !j.contains("privateKey") || !j["privateKey"].is_string()) {
            LOG_WARN("Stored device identity is malformed, generating a new one");
            return std::nullopt;
        }

        DeviceIdentity id{
            j["id"].get<std::string>(),
            j["publicKey"].get<std::string>(),
            j["privateKey"].get<std::string>(),
            j.value("createdAt", std::string{})
        };
        try {
            keys_ = std::make_unique<DeviceKeyPair>(DeviceKeyPair::import(id.publicKey, id.privateKey));
        }
        catch (const SyncError& e) {
            LOG_WARN(std::string("Stored device keys cannot be imported (") + e.what() + "), generating new identity");
            return std::nullopt;
        }
        return id;
    }

    std::string DeviceIdentityManager::ensureIdentity() {
        if (identity_) return identity_->deviceId;

        try {
            if (auto stored = loadStored()) {
                identity_ = std::move(stored);
                LOG_INFO("Device identity loaded: " + identity_->deviceId);
                return identity_->deviceId;
            }

            std::array<uint8_t, 16> raw{};
            randomFill(raw);
            auto keys = std::make_unique<DeviceKeyPair>(DeviceKeyPair::generate());

            DeviceIdentity id{ toHex(raw), keys->exportPublicKey(), keys->exportPrivateKey(), isoNow() };
            settings_.setSetting(kSettingKey, nlohmann::json{
                {"id",         id.deviceId},
                {"publicKey",  id.publicKey},
                {"privateKey", id.privateKey},
                {"createdAt",  id.createdAt}
            });

            keys_ = std::move(keys);
            identity_ = std::move(id);
            LOG_INFO("Device identity created: " + identity_->deviceId);
            return identity_->deviceId;
        }
        catch (const SyncError&) {
            keys_.reset();
            throw;
        }
        catch (const std::exception& e) {
            keys_.reset();
            LOG_ERROR(std::string("Device identity store failure: ") + e.what());
            throw SyncError(SyncErr::IdentityStore, e.what());
        }
    }

    void DeviceIdentityManager::reset() {
        try {
            settings_.removeSetting(kSettingKey);
        }
        catch (const std::exception& e) {
            throw SyncError(SyncErr::IdentityStore, e.what());
        }
        identity_.reset();
        keys_.reset();
        LOG_INFO("Device identity reset");
    }

}
