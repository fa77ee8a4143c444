/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/jrpc/jrpc_handle_batch.hpp"

#include <jsonrpc-lean/server.h>
#include <rapidjson/memorystream.h>
#include <rapidjson/reader.h>

namespace sigil::api {

  /**
   * Splits a batch into single requests without building a DOM.
   * Callback is invoked with the raw text of each array element.
   */
  template <typename Cb>
  struct Parser {
    Cb cb;

    rapidjson::MemoryStream stream{nullptr, 0};
    size_t level = 0;
    size_t begin = 0;

    bool parse(std::string_view request) {
      stream = {request.data(), request.size()};
      rapidjson::Reader reader;
      return reader.Parse(stream, *this);
    }

    bool scalar() const {
      return level > 1;
    }
    bool Null() {
      return scalar();
    }
    bool Bool(bool) {
      return scalar();
    }
    bool Int(int) {
      return scalar();
    }
    bool Uint(unsigned) {
      return scalar();
    }
    bool Int64(int64_t) {
      return scalar();
    }
    bool Uint64(uint64_t) {
      return scalar();
    }
    bool Double(double) {
      return scalar();
    }
    bool RawNumber(const char *, size_t, bool) {
      return scalar();
    }
    bool String(const char *, size_t, bool) {
      return scalar();
    }
    bool Key(const char *, size_t, bool) {
      return scalar();
    }
    bool StartArray() {
      if (level == 1) {
        return false;
      }
      ++level;
      return true;
    }
    bool EndArray(size_t) {
      --level;
      return true;
    }
    bool StartObject() {
      if (level == 0) {
        return false;
      }
      if (level == 1) {
        begin = stream.Tell() - 1;
      }
      ++level;
      return true;
    }
    bool EndObject(size_t) {
      --level;
      if (level == 1) {
        const size_t end = stream.Tell();
        std::string_view request(stream.begin_ + begin, end - begin);
        cb(request);
      }
      return true;
    }
  };

  JrpcHandleBatch::JrpcHandleBatch(jsonrpc::Server &handler,
                                   std::string_view request) {
    // jsonrpc-lean takes only std::string
    std::string single;
    if (request.starts_with('[')) {
      auto on_request = [&](std::string_view element) {
        single = element;
        auto formatted = handler.HandleRequest(single);
        if (formatted->GetSize() == 0) {
          // notification, nothing to answer
          return;
        }
        batch_.push_back(batch_.empty() ? '[' : ',');
        batch_.append(formatted->GetData(), formatted->GetSize());
      };
      Parser<decltype(on_request) &> parser{on_request};
      if (parser.parse(request)) {
        if (not batch_.empty()) {
          batch_.push_back(']');
        }
        return;
      }
      // not a well-formed batch, let jsonrpc-lean report the error
      batch_.clear();
    }
    single = request;
    formatted_ = handler.HandleRequest(single);
  }

  std::string_view JrpcHandleBatch::response() const {
    if (formatted_ == nullptr) {
      return batch_;
    }
    return {formatted_->GetData(), formatted_->GetSize()};
  }
}  // namespace sigil::api
