#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <vector>

namespace boost_util {

void write_str_to_file(const std::string& str, const boost::filesystem::path& filename) {
  std::ofstream file(filename.string());
  if (!file.is_open()) {
    throw util::CleanException("Unable to open file for writing: {}", filename.string());
  }
  file << str;
  file.close();
  if (file.fail()) {
    throw util::CleanException("Failed to write file: {}", filename.string());
  }
}

std::string read_str_from_file(const boost::filesystem::path& filename) {
  if (!boost::filesystem::is_regular_file(filename)) {
    throw util::CleanException("File not found: {}", filename.string());
  }
  std::ifstream file(filename.string());
  if (!file.is_open()) {
    throw util::CleanException("Unable to open file for reading: {}", filename.string());
  }
  return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

boost::json::value read_json_from_file(const boost::filesystem::path& filename) {
  std::string contents = read_str_from_file(filename);

  boost::json::error_code ec;
  boost::json::value jv = boost::json::parse(contents, ec);
  if (ec) {
    throw util::CleanException("Invalid JSON in {}: {}", filename.string(), ec.message());
  }
  return jv;
}

// Adapted from the pretty_print() example in the Boost.JSON documentation:
// https://www.boost.org/doc/libs/1_76_0/libs/json/doc/html/json/examples.html
void pretty_print(std::ostream& os, const boost::json::value& jv, std::string* indent) {
  std::string indent_;
  if (!indent) indent = &indent_;

  switch (jv.kind()) {
    case boost::json::kind::object: {
      const auto& obj = jv.get_object();
      if (obj.empty()) {
        os << "{}";
        break;
      }

      std::vector<boost::json::object::const_iterator> its;
      its.reserve(obj.size());
      for (auto it = obj.begin(); it != obj.end(); ++it) its.push_back(it);
      std::sort(its.begin(), its.end(), [](auto a, auto b) { return a->key() < b->key(); });

      os << "{\n";
      indent->append(2, ' ');
      for (size_t i = 0; i < its.size(); ++i) {
        if (i) os << ",\n";
        os << *indent << boost::json::serialize(its[i]->key()) << ": ";
        pretty_print(os, its[i]->value(), indent);
      }
      indent->resize(indent->size() - 2);
      os << "\n" << *indent << "}";
      break;
    }

    case boost::json::kind::array: {
      const auto& arr = jv.get_array();
      if (arr.empty()) {
        os << "[]";
        break;
      }

      bool simple = std::none_of(arr.begin(), arr.end(), [](const boost::json::value& v) {
        return v.is_object() || v.is_array();
      });

      if (simple) {
        os << "[";
        for (size_t i = 0; i < arr.size(); ++i) {
          if (i) os << ", ";
          pretty_print(os, arr[i], indent);
        }
        os << "]";
      } else {
        os << "[\n";
        indent->append(2, ' ');
        for (size_t i = 0; i < arr.size(); ++i) {
          if (i) os << ",\n";
          os << *indent;
          pretty_print(os, arr[i], indent);
        }
        indent->resize(indent->size() - 2);
        os << "\n" << *indent << "]";
      }
      break;
    }

    case boost::json::kind::string:
      os << boost::json::serialize(jv.get_string());
      break;

    case boost::json::kind::uint64:
      os << jv.get_uint64();
      break;

    case boost::json::kind::int64:
      os << jv.get_int64();
      break;

    case boost::json::kind::double_: {
      double x = jv.get_double();
      os << (x == 0 ? 0.0 : x);  // avoid printing -0
      break;
    }

    case boost::json::kind::bool_:
      os << (jv.get_bool() ? "true" : "false");
      break;

    case boost::json::kind::null:
      os << "null";
      break;
  }
}

}  // namespace boost_util
