#include "io/write.hpp"

#include "context.hpp"
#include "runtime/basic_types.hpp"
#include "runtime/records.hpp"
#include "util/object_conversions.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace isomer {

static std::string
write_number(double value) {
  if (std::isnan(value))
    return "NaN";
  else if (std::isinf(value))
    return value > 0 ? "Infinity" : "-Infinity";
  else if (value == std::trunc(value)
           && std::abs(value) < static_cast<double>(std::numeric_limits<std::int64_t>::max()))
    return fmt::format("{}", static_cast<std::int64_t>(value));
  else
    return fmt::format("{}", value);
}

static std::string
write_string(std::string const& value) {
  std::string result = "\"";
  for (char c : value)
    switch (c) {
    case '"':  result += "\\\""; break;
    case '\\': result += "\\\\"; break;
    case '\n': result += "\\n"; break;
    case '\t': result += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20 || c == '\x7f')
        result += fmt::format("\\x{:02x}", static_cast<unsigned char>(c));
      else
        result += c;
    }
  result += '"';
  return result;
}

namespace {
  class writer {
  public:
    explicit
    writer(context& ctx) : ctx_{ctx} { }

    void
    write(ptr<> x, std::size_t depth);

    std::string
    result() && { return std::move(out_); }

  private:
    context&    ctx_;
    std::string out_;

    void
    write_fields(field_table const& fields, std::size_t depth);
  };
}

void
writer::write(ptr<> x, std::size_t depth) {
  if (is_undefined(x))
    out_ += "undefined";
  else if (is<null_type>(x))
    out_ += "null";
  else if (auto b = match<boolean>(x))
    out_ += b->value() ? "true" : "false";
  else if (auto n = match<number>(x))
    out_ += write_number(n->value());
  else if (auto s = match<string>(x))
    out_ += write_string(s->value());
  else if (auto sym = match<symbol>(x))
    out_ += fmt::format("Symbol({})", sym->description());
  else if (auto p = match<procedure>(x))
    out_ += fmt::format("<procedure {}>", p->name());
  else if (auto t = match<record_type>(x))
    out_ += fmt::format("<record-type {}>", t->name());
  else if (depth >= max_write_depth)
    out_ += "...";
  else if (auto v = match<vector>(x)) {
    out_ += '[';
    for (std::size_t i = 0; i < v->size(); ++i) {
      if (i > 0)
        out_ += ", ";
      write(v->ref(i), depth + 1);
    }
    out_ += ']';
  } else if (auto t = match<table>(x)) {
    out_ += "Map{";
    bool first = true;
    for (auto const& [key, value] : t->entries()) {
      if (!first)
        out_ += ", ";
      first = false;
      out_ += write_string(key);
      out_ += " => ";
      write(value, depth + 1);
    }
    out_ += '}';
  } else if (auto r = match<record>(x)) {
    if (r->type() && r->type() != ctx_.constants->default_record_type)
      out_ += r->type()->name();
    write_fields(r->fields(), depth);
  } else
    out_ += fmt::format("<{}>", object_type_name(x));
}

void
writer::write_fields(field_table const& fields, std::size_t depth) {
  out_ += '{';
  bool first = true;
  for (field const& f : fields.fields()) {
    if (!f.enumerable)
      continue;

    if (!first)
      out_ += ", ";
    first = false;
    out_ += f.name;
    out_ += ": ";
    write(f.value, depth + 1);
  }
  out_ += '}';
}

std::string
datum_to_string(context& ctx, ptr<> x) {
  writer w{ctx};
  w.write(x, 0);
  return std::move(w).result();
}

} // namespace isomer
