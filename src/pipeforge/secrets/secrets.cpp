#include "pipeforge/secrets/secrets.hpp"

#include "pipeforge/util/log.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <fstream>
#include <iterator>

namespace pipeforge {

auto EnvSecretsProvider::get(std::string_view name) -> Result<std::string> {
  auto it = environment_.find(std::string(name));
  if (it == environment_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

auto DotenvSecretsProvider::from_string(std::string_view text)
    -> std::unique_ptr<DotenvSecretsProvider> {
  std::map<std::string, std::string> values;
  std::size_t pos = 0;
  int line_no = 0;
  while (pos <= text.size()) {
    auto end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    auto line =
        boost::algorithm::trim_copy(std::string(text.substr(pos, end - pos)));
    pos = end + 1;
    ++line_no;
    if (line.empty() || line.front() == '#') {
      continue;
    }
    if (line.starts_with("export ")) {
      line = boost::algorithm::trim_copy(line.substr(7));
    }
    const auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      log::warn("dotenv line {} ignored: expected KEY=VALUE", line_no);
      continue;
    }
    auto key = boost::algorithm::trim_copy(line.substr(0, eq));
    auto value = boost::algorithm::trim_copy(line.substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    values.insert_or_assign(std::move(key), std::move(value));
  }
  return std::unique_ptr<DotenvSecretsProvider>(
      new DotenvSecretsProvider(std::move(values)));
}

auto DotenvSecretsProvider::load(const std::filesystem::path &path)
    -> Result<std::unique_ptr<DotenvSecretsProvider>> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    log::error("cannot open secrets file {}", path.string());
    return fail(Error::FileNotFound);
  }
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  return ok(from_string(text));
}

auto DotenvSecretsProvider::get(std::string_view name) -> Result<std::string> {
  auto it = values_.find(std::string(name));
  if (it == values_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

} // namespace pipeforge
