// Ticket: 0002_core_datatypes

#ifndef SHATTER_SIM_COMPONENT_FORMATTER_HPP
#define SHATTER_SIM_COMPONENT_FORMATTER_HPP

#include <format>
#include <string>
#include <tuple>

namespace shatter_sim::detail
{

/// Shared std::formatter base for small fixed-size numeric types.
/// Parses [width][.precision][type] and emits "(c0, c1, ...)" for whatever
/// tuple the accessor returns, so vectors and quaternions share one parser.
template <typename T>
struct ComponentFormatter
{
  char presentation = 'f';
  int precision = 6;
  int width = 0;

  constexpr auto parse(std::format_parse_context& ctx)
  {
    auto it = ctx.begin();
    auto end = ctx.end();

    if (it == end || *it == '}')
    {
      return it;
    }

    if (it != end && *it >= '0' && *it <= '9')
    {
      width = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        width = width * 10 + (*it - '0');
        ++it;
      }
    }

    if (it != end && *it == '.')
    {
      ++it;
      precision = 0;
      while (it != end && *it >= '0' && *it <= '9')
      {
        precision = precision * 10 + (*it - '0');
        ++it;
      }
    }

    if (it != end && (*it == 'f' || *it == 'e' || *it == 'g'))
    {
      presentation = *it;
      ++it;
    }

    return it;
  }

protected:
  std::string formatComponent(double value) const
  {
    std::string componentFmt = "{:";
    if (width > 0)
    {
      componentFmt += std::to_string(width);
    }
    componentFmt += '.';
    componentFmt += std::to_string(precision);
    componentFmt += presentation;
    componentFmt += '}';
    return std::vformat(componentFmt, std::make_format_args(value));
  }

  template <typename F>
  auto formatComponents(const T& value,
                        F&& accessor,
                        std::format_context& ctx) const
  {
    std::string body;
    std::apply(
      [&](auto... components)
      {
        bool first = true;
        ((body += (first ? "" : ", ") + formatComponent(components),
          first = false),
         ...);
      },
      accessor(value));
    return std::format_to(ctx.out(), "({})", body);
  }
};

}  // namespace shatter_sim::detail

#endif  // SHATTER_SIM_COMPONENT_FORMATTER_HPP
