/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>
#include <optional>
#include <string>
#include <tuple>

#include <jsonrpc-lean/fault.h>
#include <jsonrpc-lean/request.h>

#include "common/buffer.hpp"
#include "common/hexutil.hpp"
#include "schnorr/principal.hpp"
#include "schnorr/types.hpp"

namespace sigil::api::details {

  struct LoadValue {
    static void throwInvalidType() {
      throw jsonrpc::InvalidParametersFault{"invalid argument type"};
    }

    static void throwInvalidValue() {
      throw jsonrpc::InvalidParametersFault{"invalid argument value"};
    }

    template <typename T>
    static T unwrap(outcome::result<T> &&r) {
      if (r) {
        return std::move(r.value());
      }
      throw jsonrpc::InvalidParametersFault{r.error().message()};
    }

    static const jsonrpc::Value &mapAt(const jsonrpc::Value &j,
                                       const std::string &k) {
      if (not j.IsStruct()) {
        throwInvalidType();
      }
      auto &m = j.AsStruct();
      if (auto it = m.find(k); it != m.end()) {
        return it->second;
      }
      throw jsonrpc::InvalidParametersFault{"missing field " + k};
    }

    /// Absent optional fields read as null
    static const jsonrpc::Value &optionalAt(const jsonrpc::Value &j,
                                            const std::string &k) {
      static const jsonrpc::Value kNull;
      if (not j.IsStruct()) {
        throwInvalidType();
      }
      auto &m = j.AsStruct();
      if (auto it = m.find(k); it != m.end()) {
        return it->second;
      }
      return kNull;
    }

    template <typename T>
    static void loadValue(std::optional<T> &dst, const jsonrpc::Value &src) {
      if (!src.IsNil()) {
        T t;
        loadValue(t, src);
        dst = std::move(t);
      } else {
        dst = std::nullopt;
      }
    }

    template <typename SequenceContainer,
              typename = typename SequenceContainer::value_type,
              typename = typename SequenceContainer::iterator>
    static void loadValue(SequenceContainer &dst, const jsonrpc::Value &src) {
      if (!src.IsNil() && src.IsArray()) {
        for (auto &v : src.AsArray()) {
          typename SequenceContainer::value_type t;
          loadValue(t, v);
          dst.insert(dst.end(), std::move(t));
        }
      } else {
        throwInvalidType();
      }
    }

    template <typename T>
    static std::enable_if_t<std::is_integral_v<T>, void> loadValue(
        T &dst, const jsonrpc::Value &src) {
      if (not src.IsInteger32() and not src.IsInteger64()) {
        throwInvalidType();
      }
      auto num = src.AsInteger64();
      if constexpr (std::is_signed_v<T>) {
        if (num < std::numeric_limits<T>::min()
            or num > std::numeric_limits<T>::max()) {
          throwInvalidValue();
        }
      } else {
        if (num < 0
            or static_cast<uint64_t>(num) > std::numeric_limits<T>::max()) {
          throwInvalidValue();
        }
      }
      dst = static_cast<T>(num);
    }

    static void loadValue(std::string &dst, const jsonrpc::Value &src) {
      if (not src.IsString()) {
        throwInvalidType();
      }
      dst = src.AsString();
    }

    static void loadValue(common::Buffer &out, const jsonrpc::Value &j) {
      if (not j.IsString()) {
        throwInvalidType();
      }
      auto &s = j.AsString();
      if (s.starts_with("0x")) {
        out = unwrap(common::unhexWith0x(s));
      } else {
        out = unwrap(common::unhex(s));
      }
    }

    static void loadValue(schnorr::HeaderField &out, const jsonrpc::Value &j) {
      if (not j.IsArray() or j.AsArray().size() != 2) {
        throwInvalidType();
      }
      loadValue(out.first, j.AsArray()[0]);
      loadValue(out.second, j.AsArray()[1]);
    }

    static void loadValue(std::optional<schnorr::Principal> &out,
                          const jsonrpc::Value &j) {
      if (j.IsNil()) {
        out = std::nullopt;
        return;
      }
      std::string text;
      loadValue(text, j);
      out = unwrap(schnorr::Principal::fromText(text));
    }

    static void loadValue(schnorr::SchnorrAlgorithm &out,
                          const jsonrpc::Value &j) {
      std::string name;
      loadValue(name, j);
      out = unwrap(schnorr::algorithmFromString(name));
    }

    static void loadValue(schnorr::SchnorrKeyId &out, const jsonrpc::Value &j) {
      loadValue(out.algorithm, mapAt(j, "algorithm"));
      loadValue(out.name, mapAt(j, "name"));
    }

    static void loadValue(schnorr::SchnorrPublicKeyArgs &out,
                          const jsonrpc::Value &j) {
      loadValue(out.key_id, mapAt(j, "key_id"));
      loadValue(out.canister_id, optionalAt(j, "canister_id"));
      loadValue(out.derivation_path, mapAt(j, "derivation_path"));
    }

    static void loadValue(schnorr::SignWithSchnorrArgs &out,
                          const jsonrpc::Value &j) {
      loadValue(out.key_id, mapAt(j, "key_id"));
      loadValue(out.derivation_path, mapAt(j, "derivation_path"));
      loadValue(out.message, mapAt(j, "message"));
    }

    static void loadValue(schnorr::HttpRequest &out, const jsonrpc::Value &j) {
      loadValue(out.url, mapAt(j, "url"));
      loadValue(out.method, mapAt(j, "method"));
      loadValue(out.body, mapAt(j, "body"));
      loadValue(out.headers, mapAt(j, "headers"));
      loadValue(out.certificate_version, optionalAt(j, "certificate_version"));
    }
  };

  template <size_t I, typename... T>
  void decodeArgsLoop(std::tuple<T...> &args,
                      const jsonrpc::Request::Parameters &json) {
    if constexpr (I < sizeof...(T)) {
      static const jsonrpc::Value kNull;
      LoadValue::loadValue(std::get<I>(args),
                           I < json.size() ? json.at(I) : kNull);
      decodeArgsLoop<I + 1>(args, json);
    }
  }

  /**
   * Decodes positional parameters into {@param args}.
   * Missing trailing parameters are passed as null.
   */
  template <typename... T>
  void decodeArgs(std::tuple<T...> &args,
                  const jsonrpc::Request::Parameters &json) {
    if (json.size() > sizeof...(T)) {
      throw jsonrpc::InvalidParametersFault("Incorrect number of params");
    }
    decodeArgsLoop<0>(args, json);
  }

}  // namespace sigil::api::details
