#include "app/JsonSerializer.hpp"

#include <charconv>

namespace {

void append_fixed(std::string& out, double v, int precision) {
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed, precision);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

template <typename Int>
void append_int(std::string& out, Int v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_string(std::string& out, std::string_view sv) {
  static constexpr char kHex[] = "0123456789abcdef";
  out += '"';
  for (char ch : sv) {
    auto c = static_cast<unsigned char>(ch);
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (c < 0x20) {
      out += "\\u00";
      out += kHex[c >> 4];
      out += kHex[c & 0xF];
    } else {
      out += ch;
    }
  }
  out += '"';
}

void key(std::string& out, const char* indent, const char* name) {
  out += indent;
  out += '"';
  out += name;
  out += "\": ";
}

} // namespace

namespace procstat::app {

std::string snapshot_to_json(const std::vector<procstat::model::ProcessSample>& rows, const JsonReport& report) {
  std::string out;
  out.reserve(256 + rows.size() * 224);
  out += "{\n";
  key(out, "    ", "timestamp");  append_int(out, report.timestamp);  out += ",\n";
  key(out, "    ", "uptime");  append_fixed(out, report.uptime_s, 2);  out += ",\n";
  key(out, "    ", "total_processes");  append_int(out, report.total_processes);  out += ",\n";
  key(out, "    ", "processes");
  if (rows.empty()) {
    out += "[]\n}\n";
    return out;
  }
  out += "[\n";
  for (size_t i = 0; i < rows.size(); ++i) {
    const auto& r = rows[i];
    out += "        {\n";
    key(out, "            ", "pid");  append_int(out, r.pid);  out += ",\n";
    key(out, "            ", "ppid");  append_int(out, r.ppid);  out += ",\n";
    key(out, "            ", "cpu");  append_fixed(out, r.cpu_pct, 1);  out += ",\n";
    key(out, "            ", "memory");  append_fixed(out, memory_in_unit(r, report.unit), 1);  out += ",\n";
    key(out, "            ", "command");  append_string(out, r.command_line);  out += ",\n";
    key(out, "            ", "state");  append_string(out, std::string_view(&r.state, 1));  out += ",\n";
    key(out, "            ", "time");  append_fixed(out, r.cpu_time_s, 1);  out += ",\n";
    key(out, "            ", "type");  append_string(out, r.is_thread() ? "thread" : "process");  out += '\n';
    out += (i + 1 < rows.size()) ? "        },\n" : "        }\n";
  }
  out += "    ]\n}\n";
  return out;
}

} // namespace procstat::app
