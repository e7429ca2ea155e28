#include <Serializable/NameUtils.hpp>

#include <initializer_list>

namespace Serializable::detail
{

  namespace
  {
    std::string_view StripElaboration(std::string_view s)
    {
      for (std::string_view prefix : {"class ", "struct ", "enum ", "union "})
      {
        if (s.substr(0, prefix.size()) == prefix)
          return s.substr(prefix.size());
      }
      return s;
    }

    // Replaces every "::" outside template argument lists with '.'.
    std::string DotPath(std::string_view s)
    {
      std::string out;
      out.reserve(s.size());
      int depth = 0;
      for (std::size_t i = 0; i < s.size(); ++i)
      {
        const char c = s[i];
        if (c == '<')
          ++depth;
        else if (c == '>')
          --depth;
        if (depth == 0 && c == ':' && i + 1 < s.size() && s[i + 1] == ':')
        {
          out.push_back('.');
          ++i;
          continue;
        }
        out.push_back(c);
      }
      return out;
    }
  } // namespace

  std::pair<std::string, std::string> SplitNativeName(std::string_view nativeName)
  {
    const auto name = StripElaboration(nativeName);
    const auto templ = name.find('<');
    const auto head = name.substr(0, templ);
    const auto sep = head.rfind("::");
    if (sep == std::string_view::npos)
      return {std::string{DefaultModuleName}, std::string{name}};
    return {DotPath(name.substr(0, sep)), std::string{name.substr(sep + 2)}};
  }

  std::string JoinPath(std::string_view module, std::string_view name)
  {
    std::string out;
    out.reserve(module.size() + 1 + name.size());
    out.append(module);
    if (!module.empty() && !name.empty())
      out.push_back('.');
    out.append(name);
    return out;
  }

  std::vector<std::string_view> SplitPath(std::string_view path)
  {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true)
    {
      const auto dot = path.find('.', start);
      if (dot == std::string_view::npos)
      {
        parts.push_back(path.substr(start));
        return parts;
      }
      parts.push_back(path.substr(start, dot - start));
      start = dot + 1;
    }
  }

} // namespace Serializable::detail
