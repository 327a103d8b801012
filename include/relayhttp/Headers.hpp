#ifndef RELAY_HTTP_HEADERS_HPP
#define RELAY_HTTP_HEADERS_HPP

#include <map>
#include <string>
#include <vector>

namespace relayhttp {

  // Case-insensitive header collection. Keys are stored lowercased.
  // `set-cookie` and `www-authenticate` keep every value in arrival order,
  // every other key keeps only the last value set.
  class Headers {
    public:
      static Headers parse(const std::string& rawHeaders);
      static bool isMultiValued(const std::string& key);

      // Returns a new collection: overrides replace single-valued keys of
      // base, multi-valued keys are concatenated.
      static Headers merge(const Headers& base, const Headers& overrides);

      void load(const std::string& rawHeaders);

      // Wire form, one `key:  value\r\n` line per value. Cached.
      const std::string& dump() const;

      std::vector<std::string> keys() const;
      std::string get(const std::string& key) const;
      std::vector<std::string> getAll(const std::string& key) const;
      void set(const std::string& key, const std::string& value);
      bool has(const std::string& key) const;
      void remove(const std::string& key);
      void clear();
      size_t size() const;
      bool empty() const;

      bool operator==(const Headers& other) const;
      bool operator!=(const Headers& other) const;

    private:
      std::map<std::string, std::vector<std::string>> headers_;

      mutable std::string dumped_;
      mutable bool dumped_valid_ = false;
  };

} // namespace relayhttp

#endif // RELAY_HTTP_HEADERS_HPP
