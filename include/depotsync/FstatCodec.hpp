#pragma once
#include "types.hpp"
#include <iosfwd>
#include <optional>
#include <string>

namespace depotsync {

/**
 * FstatCodec converts records to and from the line format shared by every
 * stage:
 *
 *   change,path,revision,action,type,size,digest[,extra...][,!annotation]
 *
 * Commas and semicolons inside the path are escaped as ";." and ";;".
 * decode() followed by encode() reproduces the input line byte for byte.
 */
class FstatCodec {
public:
  static constexpr std::size_t kFixedColumns = 7;
  static constexpr std::size_t kDigestLength = 64;

  static std::string encode(const FstatRecord &record);
  static FstatRecord decode(const std::string &line);

  static std::string escape(const std::string &text);
  static std::string unescape(const std::string &text,
                              const std::string &line);

  // Parses a plain decimal of at most 18 digits, so it always fits int64_t.
  // Returns std::nullopt for anything else.
  static std::optional<int64_t> parseNumber(const std::string &text);

  // True for comment lines ('#...'), which carry no record.
  static bool isComment(const std::string &line);

  // Weight of a record in a batch: encoded line length plus newline.
  static std::size_t weight(const FstatRecord &record);

  // Reads the next record from the stream, skipping comment lines.
  // Returns std::nullopt at end of stream; throws MalformedRecord.
  static std::optional<FstatRecord> read(std::istream &in);
  static void write(std::ostream &out, const FstatRecord &record);

  // Throws MalformedRecord if the record can not be represented.
  static void validate(const FstatRecord &record);
};

} // namespace depotsync
