#include "crypto/certificate.hpp"
#include "common/logger.hpp"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ec.h>
#include <openssl/x509.h>
#include <openssl/err.h>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

// Helper deleters for unique_ptr
struct BIO_Deleter { void operator()(BIO* b) { BIO_free_all(b); } };
struct EVP_PKEY_Deleter { void operator()(EVP_PKEY* p) { EVP_PKEY_free(p); } };
struct X509_Deleter { void operator()(X509* x) { X509_free(x); } };

namespace {
    constexpr long VALIDITY_SECONDS = 10L * 365 * 24 * 60 * 60;

    [[noreturn]] void throw_openssl(const std::string& what) {
        unsigned long code = ERR_get_error();
        std::string detail;
        if (code != 0) {
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            detail = std::string(": ") + buf;
        }
        throw std::runtime_error(what + detail);
    }

    std::string bio_to_string(BIO* bio) {
        char* data = nullptr;
        long len = BIO_get_mem_data(bio, &data);
        if (len <= 0 || data == nullptr) {
            throw_openssl("Empty PEM output");
        }
        return std::string(data, static_cast<size_t>(len));
    }

    void write_file(const fs::path& path, const std::string& content) {
        if (path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
        }
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot write " + path.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            throw std::runtime_error("Short write to " + path.string());
        }
    }
}

std::pair<std::string, std::string> Certificate::generate_self_signed(const std::string& common_name) {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new_id(EVP_PKEY_EC, NULL), EVP_PKEY_CTX_free);

    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) <= 0) {
        throw_openssl("Error initializing keygen");
    }

    EVP_PKEY* pkey_raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &pkey_raw) <= 0) {
        throw_openssl("Error generating key");
    }
    std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter> pkey(pkey_raw);

    std::unique_ptr<X509, X509_Deleter> cert(X509_new());
    if (!cert) {
        throw_openssl("X509_new failed");
    }
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), VALIDITY_SECONDS);
    if (X509_set_pubkey(cert.get(), pkey.get()) != 1) {
        throw_openssl("X509_set_pubkey failed");
    }

    // Self-signed: subject and issuer are the same name.
    X509_NAME* name = X509_get_subject_name(cert.get());
    if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(common_name.c_str()),
                                   -1, -1, 0) != 1) {
        throw_openssl("Cannot set certificate common name");
    }
    if (X509_set_issuer_name(cert.get(), name) != 1) {
        throw_openssl("X509_set_issuer_name failed");
    }
    if (X509_sign(cert.get(), pkey.get(), EVP_sha256()) <= 0) {
        throw_openssl("X509_sign failed");
    }

    std::unique_ptr<BIO, BIO_Deleter> bio_cert(BIO_new(BIO_s_mem()));
    if (!bio_cert || PEM_write_bio_X509(bio_cert.get(), cert.get()) != 1) {
        throw_openssl("Cannot encode certificate");
    }

    std::unique_ptr<BIO, BIO_Deleter> bio_key(BIO_new(BIO_s_mem()));
    if (!bio_key || PEM_write_bio_PrivateKey(bio_key.get(), pkey.get(), NULL, NULL, 0, NULL, NULL) != 1) {
        throw_openssl("Cannot encode private key");
    }

    return {bio_to_string(bio_cert.get()), bio_to_string(bio_key.get())};
}

bool Certificate::ensure_self_signed_certificate(const fs::path& cert_file,
                                                 const fs::path& key_file,
                                                 const std::string& common_name) {
    if (fs::exists(cert_file) && fs::exists(key_file)) {
        return false;
    }

    LOG_INFO("Generating self-signed certificate for '", common_name, "' at ", cert_file.string());
    auto [cert_pem, key_pem] = generate_self_signed(common_name);
    write_file(key_file, key_pem);
    std::error_code ec;
    fs::permissions(key_file, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
        LOG_WARN("Could not restrict permissions on ", key_file.string(), ": ", ec.message());
    }
    write_file(cert_file, cert_pem);
    return true;
}
