#pragma once

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace autogrow::util {

// Minimal TOML subset: [sections], key = value, "quoted strings",
// # comments and flat ["a", "b"] arrays. Section order is preserved.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(sv.substr(1, sv.size() - 2));
        trim_inplace(current_section);
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(strip_comment(trim(sv.substr(eq + 1))));
      // Strip surrounding quotes from string values
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = unescape(val.substr(1, val.size() - 2));
      ensure_section(current_section).set(key, val);
    }
    return true;
  }

  bool save(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) return false;
    bool first = true;
    for (const auto& [name, sec] : sections_) {
      if (!first) out << '\n';
      first = false;
      if (!name.empty()) out << '[' << name << "]\n";
      for (const auto& [k, v] : sec.entries) {
        if (needs_quoting(v))
          out << k << " = \"" << escape(v) << "\"\n";
        else
          out << k << " = " << v << '\n';
      }
    }
    out.flush();
    return out.good();
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  // Empty optional when the key is missing or not an integer
  [[nodiscard]] std::optional<long long> try_get_int(std::string_view section, std::string_view key) const {
    auto val = get_string(section, key);
    if (val.empty()) return std::nullopt;
    long long v = 0;
    auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), v);
    if (ec != std::errc() || ptr != val.data() + val.size()) return std::nullopt;
    return v;
  }

  // Empty optional when the key is missing or not a number
  [[nodiscard]] std::optional<double> try_get_double(std::string_view section, std::string_view key) const {
    auto val = get_string(section, key);
    if (val.empty()) return std::nullopt;
    char* end = nullptr;
    double v = std::strtod(val.c_str(), &end);
    if (end == val.c_str() || *end != '\0') return std::nullopt;
    return v;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    // Case-insensitive true/false
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  // Accepts ["a", "b"] as well as a plain comma separated "a, b". Blank items are dropped.
  [[nodiscard]] std::vector<std::string> get_list(std::string_view section, std::string_view key) const {
    std::vector<std::string> out;
    auto raw = get_string(section, key);
    std::string_view sv = trim(raw);
    if (sv.size() >= 2 && sv.front() == '[' && sv.back() == ']') sv = sv.substr(1, sv.size() - 2);
    while (!sv.empty()) {
      auto comma = sv.find(',');
      auto item = trim(sv.substr(0, comma));
      if (item.size() >= 2 && item.front() == '"' && item.back() == '"') item = trim(item.substr(1, item.size() - 2));
      if (!item.empty()) out.emplace_back(item);
      if (comma == std::string_view::npos) break;
      sv.remove_prefix(comma + 1);
    }
    return out;
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    ensure_section(section).set(key, value);
  }

  [[nodiscard]] bool has_section(std::string_view section) const {
    return find_section(section) != nullptr;
  }

  // Named sections in file order (the unnamed top-level section is skipped)
  [[nodiscard]] std::vector<std::string> section_names() const {
    std::vector<std::string> out;
    for (const auto& [n, s] : sections_)
      if (!n.empty()) out.push_back(n);
    return out;
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static void trim_inplace(std::string& s) {
    auto sv = trim(std::string_view(s));
    s = std::string(sv);
  }

  // Drop a trailing "# ..." comment that is outside of quotes.
  // Inside quotes a backslash escapes the next character.
  static std::string_view strip_comment(std::string_view sv) {
    bool in_quotes = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (in_quotes && sv[i] == '\\') ++i;
      else if (sv[i] == '"') in_quotes = !in_quotes;
      else if (sv[i] == '#' && !in_quotes) return trim(sv.substr(0, i));
    }
    return sv;
  }

  // \" and \\ inside quoted strings; other backslashes are kept as written
  static std::string escape(const std::string& val) {
    std::string out;
    out.reserve(val.size());
    for (char c : val) {
      if (c == '"' || c == '\\') out.push_back('\\');
      out.push_back(c);
    }
    return out;
  }

  static std::string unescape(const std::string& val) {
    std::string out;
    out.reserve(val.size());
    for (size_t i = 0; i < val.size(); ++i) {
      if (val[i] == '\\' && i + 1 < val.size() && (val[i + 1] == '"' || val[i + 1] == '\\')) ++i;
      out.push_back(val[i]);
    }
    return out;
  }

  static bool needs_quoting(const std::string& val) {
    if (val.empty()) return true;
    if (val == "true" || val == "false") return false;
    // Check if it's a pure integer
    size_t start = (val[0] == '-') ? 1 : 0;
    bool all_digits = (start < val.size());
    for (size_t i = start; i < val.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(val[i]))) { all_digits = false; break; }
    }
    if (all_digits) return false;
    // Everything else is a string that needs quoting
    return true;
  }
};

} // namespace autogrow::util
