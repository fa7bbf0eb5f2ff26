#ifndef RIFT_CERTIFICATE_HPP
#define RIFT_CERTIFICATE_HPP

#include <filesystem>
#include <string>
#include <utility>

class Certificate {
public:
    // Generate a P-256 key and a self-signed certificate; returns (certificate_pem, private_key_pem)
    static std::pair<std::string, std::string> generate_self_signed(const std::string& common_name);

    /**
     * @brief Makes sure a certificate and key exist on disk.
     *
     * When either file is missing both are regenerated with generate_self_signed() and
     * written as PEM. The key file is created with owner-only permissions.
     *
     * @return true if new files were written, false if both already existed.
     * @throws std::runtime_error if OpenSSL fails or the files cannot be written.
     */
    static bool ensure_self_signed_certificate(const std::filesystem::path& cert_file,
                                               const std::filesystem::path& key_file,
                                               const std::string& common_name);
};

#endif // RIFT_CERTIFICATE_HPP
