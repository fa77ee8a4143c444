/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include <jsonrpc-lean/value.h>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "common/hexutil.hpp"
#include "schnorr/types.hpp"

namespace sigil::api {

  using jString = jsonrpc::Value::String;
  using jArray = jsonrpc::Value::Array;
  using jStruct = jsonrpc::Value::Struct;

  inline jsonrpc::Value makeValue(const uint16_t &);
  inline jsonrpc::Value makeValue(const uint32_t &);
  inline jsonrpc::Value makeValue(const uint64_t &);
  inline jsonrpc::Value makeValue(const std::string &);

  template <typename T>
  inline jsonrpc::Value makeValue(const std::optional<T> &val);

  template <typename T1, typename T2>
  inline jsonrpc::Value makeValue(const std::pair<T1, T2> &val);

  template <typename T>
  inline jsonrpc::Value makeValue(const std::vector<T> &);

  template <size_t N>
  inline jsonrpc::Value makeValue(const common::Blob<N> &);

  inline jsonrpc::Value makeValue(const common::Buffer &);
  inline jsonrpc::Value makeValue(common::BufferView);
  inline jsonrpc::Value makeValue(const schnorr::SchnorrPublicKeyResult &);
  inline jsonrpc::Value makeValue(const schnorr::SignWithSchnorrResult &);
  inline jsonrpc::Value makeValue(const schnorr::HttpResponse &);

  inline jsonrpc::Value makeValue(const uint16_t &val) {
    return static_cast<int64_t>(val);
  }

  inline jsonrpc::Value makeValue(const uint32_t &val) {
    return static_cast<int64_t>(val);
  }

  inline jsonrpc::Value makeValue(const uint64_t &val) {
    return static_cast<int64_t>(val);
  }

  inline jsonrpc::Value makeValue(const std::string &val) {
    return jString{val};
  }

  template <typename T>
  inline jsonrpc::Value makeValue(const std::optional<T> &val) {
    if (!val) {
      return {};
    }
    return makeValue(*val);
  }

  template <typename T1, typename T2>
  inline jsonrpc::Value makeValue(const std::pair<T1, T2> &val) {
    jArray data;

    data.reserve(2);
    data.emplace_back(makeValue(val.first));
    data.emplace_back(makeValue(val.second));

    return data;
  }

  template <typename T>
  inline jsonrpc::Value makeValue(const std::vector<T> &v) {
    jArray value;

    value.reserve(v.size());
    for (auto &item : v) {
      value.emplace_back(makeValue(item));
    }

    return value;
  }

  template <size_t N>
  inline jsonrpc::Value makeValue(const common::Blob<N> &val) {
    return common::hex_lower_0x(val);
  }

  inline jsonrpc::Value makeValue(const common::Buffer &val) {
    return common::hex_lower_0x(val);
  }

  inline jsonrpc::Value makeValue(common::BufferView val) {
    return common::hex_lower_0x(val);
  }

  inline jsonrpc::Value makeValue(const schnorr::SchnorrPublicKeyResult &val) {
    jStruct data;
    data["public_key"] = makeValue(val.public_key);
    data["chain_code"] = makeValue(val.chain_code);
    return data;
  }

  inline jsonrpc::Value makeValue(const schnorr::SignWithSchnorrResult &val) {
    jStruct data;
    data["signature"] = makeValue(val.signature);
    return data;
  }

  inline jsonrpc::Value makeValue(const schnorr::HttpResponse &val) {
    jStruct data;
    data["status_code"] = makeValue(val.status_code);
    data["headers"] = makeValue(val.headers);
    data["body"] = makeValue(val.body);
    return data;
  }

}  // namespace sigil::api
