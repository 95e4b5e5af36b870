/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <libp2p/crypto/key.hpp>
#include <libp2p/crypto/random_generator/boost_generator.hpp>
#include <libp2p/crypto/secp256k1_provider/secp256k1_provider_impl.hpp>
#include <qtils/read_file.hpp>
#include <qtils/unhex.hpp>

namespace histsync::networking {
  namespace detail {
    inline libp2p::crypto::secp256k1::Secp256k1ProviderImpl &
    secp256k1Provider() {
      static libp2p::crypto::secp256k1::Secp256k1ProviderImpl provider{
          std::make_shared<libp2p::crypto::random::BoostRandomGenerator>()};
      return provider;
    }

    inline libp2p::crypto::KeyPair toLibp2pKeyPair(
        const libp2p::crypto::secp256k1::KeyPair &keypair) {
      return libp2p::crypto::KeyPair{
          .publicKey = {{
              .type = libp2p::crypto::Key::Type::Secp256k1,
              .data = qtils::ByteVec{keypair.public_key},
          }},
          .privateKey = {{
              .type = libp2p::crypto::Key::Type::Secp256k1,
              .data = qtils::ByteVec{keypair.private_key},
          }},
      };
    }
  }  // namespace detail

  /**
   * Identity key of the node.
   * @param hex_or_path secp256k1 private key as hex, or path to a file
   * containing it; a fresh key is generated when absent
   */
  inline outcome::result<libp2p::crypto::KeyPair> nodeKeyPair(
      const std::optional<std::string> &hex_or_path) {
    if (not hex_or_path.has_value()) {
      BOOST_OUTCOME_TRY(auto keypair, detail::secp256k1Provider().generate());
      return detail::toLibp2pKeyPair(keypair);
    }
    std::string hex{hex_or_path.value()};
    boost::trim(hex);
    libp2p::crypto::secp256k1::KeyPair keypair;
    auto unhex_result = qtils::unhex0x(keypair.private_key, hex, true);
    if (not unhex_result.has_value()
        and std::filesystem::exists(hex_or_path.value())) {
      BOOST_OUTCOME_TRY(hex, qtils::readText(hex_or_path.value()));
      boost::trim(hex);
      unhex_result = qtils::unhex0x(keypair.private_key, hex, true);
    }
    BOOST_OUTCOME_TRY(unhex_result);
    BOOST_OUTCOME_TRY(keypair.public_key,
                      detail::secp256k1Provider().derive(keypair.private_key));
    return detail::toLibp2pKeyPair(keypair);
  }
}  // namespace histsync::networking
