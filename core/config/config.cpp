/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/config.hpp"

#include <boost/filesystem.hpp>
#include <boost/property_tree/json_parser.hpp>

namespace tv::config {

  outcome::result<void> Config::load(const std::string &filename) {
    if (!boost::filesystem::exists(filename)) {
      return ConfigError::kCannotOpenFile;
    }
    try {
      boost::property_tree::read_json(filename, ptree_);
    } catch (const boost::property_tree::json_parser::json_parser_error &) {
      return ConfigError::kJSONParserError;
    }
    return outcome::success();
  }

  outcome::result<void> Config::save(const std::string &filename) const {
    try {
      boost::property_tree::write_json(filename, ptree_);
    } catch (const boost::property_tree::file_parser_error &) {
      return ConfigError::kCannotOpenFile;
    }
    return outcome::success();
  }

  bool Config::has(const ConfigKey &key) const {
    return ptree_.get_child_optional(key).is_initialized();
  }

}  // namespace tv::config
