#pragma once

#include <string>

namespace tollgate::signer {

// Checks that the serving key matches its certificate, the certificate is
// currently valid and any CA bundle holds at least one certificate.
void ValidateServerTlsCredentials(const std::string& cert_pem,
                                  const std::string& key_pem,
                                  const std::string& ca_bundle_pem);

// Number of PEM certificates in `bundle_pem`.
int CountPemCertificates(const std::string& bundle_pem);

}  // namespace tollgate::signer
