#ifndef INCLUDE_WIPECERT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_WIPECERT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "wipecert/crypto/ICryptoProvider.hpp"
#include <memory>

namespace wipecert::crypto::providers
{

// Ed25519 on Monocypher.
[[nodiscard]] std::unique_ptr<wipecert::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace wipecert::crypto::providers

#endif // INCLUDE_WIPECERT_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
