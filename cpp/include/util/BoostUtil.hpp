#pragma once

#include "util/CppUtil.hpp"

#include <boost/filesystem.hpp>
#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <ostream>
#include <string>

namespace boost_util {

/*
 * Writes str to filename, truncating any existing file.
 *
 * Throws util::CleanException if the file cannot be opened or written.
 */
void write_str_to_file(const std::string& str, const boost::filesystem::path& filename);

/*
 * Returns the full contents of filename.
 *
 * Throws util::CleanException if the file does not exist or cannot be read.
 */
std::string read_str_from_file(const boost::filesystem::path& filename);

/*
 * Writes jv to os in an indented, human-readable form. Object keys are sorted. Arrays of scalars
 * are printed on a single line.
 */
void pretty_print(std::ostream& os, const boost::json::value& jv, std::string* indent = nullptr);

/*
 * Parses the contents of filename as JSON.
 *
 * Throws util::CleanException if the file cannot be read or is not valid JSON.
 */
boost::json::value read_json_from_file(const boost::filesystem::path& filename);

namespace program_options {

struct Settings {
  static inline bool help_full = false;
};

/*
 * This class is a thin wrapper around boost::program_options::options_description. It aims to
 * provide a similar interface, with the added benefit that option-naming clashes are detected at
 * compile-time, rather than at runtime.
 *
 * Before:
 *
 * namespace po = boost::program_options;
 * po::options_description desc("descr");
 * desc.add_options()
 *     ("config,c", ...)
 *     ("seed", ...)
 *     ;
 * return desc;
 *
 * After:
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description desc("descr");
 * return desc
 *     .add_option<"config", 'c'>(...)
 *     .add_option<"seed">(...)
 *     ;
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = std::integer_sequence<int>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;

  using base_t = boost::program_options::options_description;

  options_description(const char* name);
  ~options_description();

  /*
   * Similar to boost::program_options::options_description::add_options()(...), except that the
   * option name(s) is passed as a template argument, rather than as a function argument. This
   * allow for compile-time checking of name clashes.
   */
  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  /*
   * Similar to add_option(), but keeps the option hidden from the --help output. Use --help-full
   * to see hidden options. Hidden options cannot have single-character abbreviations.
   */
  template <util::StringLiteral StrLit, typename... Ts>
  auto add_hidden_option(Ts&&... ts);

  /*
   * Adds both --foo and --no-foo options. Only the one that changes *flag is shown in --help;
   * --help-full shows both.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  /*
   * Adds all options from desc to this.
   */
  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  void print(std::ostream& s) const;

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    desc.print(s);
    return s;
  }

  const base_t& get() const { return *full_base_; }
  base_t& get() { return *full_base_; }

 private:
  options_description(base_t* full_base, base_t* base) : full_base_(full_base), base_(base) {}

  template <util::StringLiteral StrLit, char Char = ' '>
  auto augment() const;

  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  base_t* full_base_;    // includes hidden options
  base_t* base_;         // excludes hidden options
  std::string tmp_str_;  // hack for convenience in augment() usage
};

/*
 * Constructs a boost::program_options::command_line_parser out of ts, which is expected to be
 * a collection of strings from the command line. Uses this to store to the passed-in desc, which
 * should be a {boost, boost_util}::program_options::options_description. Returns the parsed
 * variables_map.
 *
 * Parse errors are rethrown as util::CleanException.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

/*
 * Parses a config file of "name = value" lines (see boost::program_options::parse_config_file)
 * against desc and returns the resulting variables_map. Lines may carry trailing # comments.
 *
 * Unknown names, malformed values, and unreadable files are rethrown as util::CleanException.
 */
template <typename T>
boost::program_options::variables_map parse_config_file(const T& desc,
                                                        const boost::filesystem::path& filename);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
