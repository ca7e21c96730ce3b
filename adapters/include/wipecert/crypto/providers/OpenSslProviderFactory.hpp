#ifndef INCLUDE_WIPECERT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_WIPECERT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "wipecert/crypto/ICryptoProvider.hpp"
#include <memory>

namespace wipecert::crypto::providers
{

// Ed25519 through OpenSSL EVP raw keys. Keys and signatures match the native provider byte for byte.
[[nodiscard]] std::unique_ptr<wipecert::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace wipecert::crypto::providers

#endif // INCLUDE_WIPECERT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
