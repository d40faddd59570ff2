/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include <qtils/byte_arr.hpp>
#include <qtils/unhex.hpp>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "serde/json_fwd.hpp"

#define JSON_ASSERT(c) \
  if (not(c)) throw std::runtime_error{"json"}

namespace anchorwatch::json {
  struct Json {
    const rapidjson::Value &v;
  };

  using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

  /// Accepts any value, used for calls whose result is not interesting
  struct Ignore {};

  inline void decode(Ignore &, Json) {}

  inline std::string_view decodeStr(Json json) {
    JSON_ASSERT(json.v.IsString());
    return {json.v.GetString(), json.v.GetStringLength()};
  }

  inline void decode(std::string &v, Json json) {
    v = decodeStr(json);
  }

  inline void decode(double &v, Json json) {
    JSON_ASSERT(json.v.IsNumber());
    v = json.v.GetDouble();
  }

  template <std::integral T>
  void decode(T &v, Json json) {
    if constexpr (std::is_same_v<T, bool>) {
      JSON_ASSERT(json.v.IsBool());
      v = json.v.GetBool();
    } else if constexpr (std::is_unsigned_v<T>) {
      JSON_ASSERT(json.v.IsUint64());
      v = static_cast<T>(json.v.GetUint64());
    } else {
      JSON_ASSERT(json.v.IsInt64());
      v = static_cast<T>(json.v.GetInt64());
    }
  }

  template <size_t N>
  void decode(qtils::ByteArr<N> &v, Json json) {
    JSON_ASSERT(qtils::unhex0x(v, decodeStr(json), true).has_value());
  }

  template <typename T>
  void decode(std::optional<T> &v, Json json);
  template <typename T>
  void decode(std::vector<T> &v, Json json);
  template <typename T>
  void decode(std::unordered_map<std::string, T> &v, Json json);
  template <typename A, typename B>
  void decode(std::pair<A, B> &v, Json json);
  template <typename T>
    requires requires(T &v) {
      v.fieldNames();
      v.fields();
    }
  void decode(T &v, Json json);

  template <typename T>
  void decode(std::optional<T> &v, Json json) {
    v.reset();
    if (not json.v.IsNull()) {
      T value;
      decode(value, json);
      v.emplace(std::move(value));
    }
  }

  template <typename T>
  void decode(std::vector<T> &v, Json json) {
    v.clear();
    JSON_ASSERT(json.v.IsArray());
    for (auto it = json.v.Begin(); it != json.v.End(); ++it) {
      T value;
      decode(value, Json{*it});
      v.emplace_back(std::move(value));
    }
  }

  template <typename T>
  void decode(std::unordered_map<std::string, T> &v, Json json) {
    v.clear();
    JSON_ASSERT(json.v.IsObject());
    for (auto it = json.v.MemberBegin(); it != json.v.MemberEnd(); ++it) {
      std::string key;
      decode(key, Json{it->name});
      T value;
      decode(value, Json{it->value});
      v.emplace(std::move(key), std::move(value));
    }
  }

  /// Pairs are encoded as two-element arrays, e.g. block height ranges
  template <typename A, typename B>
  void decode(std::pair<A, B> &v, Json json) {
    JSON_ASSERT(json.v.IsArray() and json.v.Size() == 2);
    decode(v.first, Json{json.v[0]});
    decode(v.second, Json{json.v[1]});
  }

  template <size_t I, typename T>
  void decodeFields(const T &fields, const auto &field_names, Json json) {
    JSON_ASSERT(json.v.IsObject());
    auto &field = std::get<I>(fields);
    auto &field_name = field_names.at(I);
    auto it = json.v.FindMember(field_name.c_str());
    static const rapidjson::Value json_null;
    decode(field, Json{it != json.v.MemberEnd() ? it->value : json_null});
    if constexpr (I + 1 < std::tuple_size_v<T>) {
      decodeFields<I + 1>(fields, field_names, json);
    }
  }

  template <typename T>
    requires requires(T &v) {
      v.fieldNames();
      v.fields();
    }
  void decode(T &v, Json json) {
    auto fields = v.fields();
    auto &field_names = v.fieldNames();
    decodeFields<0>(fields, field_names, json);
  }

  // Encoding

  inline void encode(Writer &w, std::string_view v) {
    w.String(v.data(), static_cast<rapidjson::SizeType>(v.size()));
  }

  inline void encode(Writer &w, const std::string &v) {
    encode(w, std::string_view{v});
  }

  inline void encode(Writer &w, const char *v) {
    encode(w, std::string_view{v});
  }

  inline void encode(Writer &w, double v) {
    w.Double(v);
  }

  template <std::integral T>
  void encode(Writer &w, T v) {
    if constexpr (std::is_same_v<T, bool>) {
      w.Bool(v);
    } else if constexpr (std::is_unsigned_v<T>) {
      w.Uint64(v);
    } else {
      w.Int64(v);
    }
  }

  template <typename T>
  void encode(Writer &w, const std::optional<T> &v);
  template <typename T>
  void encode(Writer &w, const std::vector<T> &v);
  template <typename T>
  void encode(Writer &w, const std::unordered_map<std::string, T> &v);
  template <typename T>
    requires requires(const T &v) {
      v.fieldNames();
      v.fields();
    }
  void encode(Writer &w, const T &v);

  template <typename T>
  void encode(Writer &w, const std::optional<T> &v) {
    if (v.has_value()) {
      encode(w, v.value());
    } else {
      w.Null();
    }
  }

  template <typename T>
  void encode(Writer &w, const std::vector<T> &v) {
    w.StartArray();
    for (auto &item : v) {
      encode(w, item);
    }
    w.EndArray();
  }

  template <typename T>
  void encode(Writer &w, const std::unordered_map<std::string, T> &v) {
    w.StartObject();
    for (auto &[key, value] : v) {
      encode(w, key);
      encode(w, value);
    }
    w.EndObject();
  }

  template <size_t I, typename T>
  void encodeFields(Writer &w, const T &fields, const auto &field_names) {
    auto &field = std::get<I>(fields);
    bool skip = false;
    if constexpr (requires { field.has_value(); }) {
      // absent optional members are omitted rather than sent as null
      skip = not field.has_value();
    }
    if (not skip) {
      encode(w, field_names.at(I));
      encode(w, field);
    }
    if constexpr (I + 1 < std::tuple_size_v<T>) {
      encodeFields<I + 1>(w, fields, field_names);
    }
  }

  template <typename T>
    requires requires(const T &v) {
      v.fieldNames();
      v.fields();
    }
  void encode(Writer &w, const T &v) {
    w.StartObject();
    encodeFields<0>(w, v.fields(), v.fieldNames());
    w.EndObject();
  }

  /// Encodes arguments as a JSON array, e.g. positional JSON-RPC params
  template <typename... Args>
  std::string encodeArray(const Args &...args) {
    rapidjson::StringBuffer buffer;
    Writer w{buffer};
    w.StartArray();
    (encode(w, args), ...);
    w.EndArray();
    return {buffer.GetString(), buffer.GetSize()};
  }

  template <typename T>
  void decode(T &v, std::string_view json_str) {
    rapidjson::Document document;
    document.Parse(json_str.data(), json_str.size());
    JSON_ASSERT(not document.HasParseError());
    decode(v, Json{document});
  }
}  // namespace anchorwatch::json
