#include <ltbf/report.hpp>
#include <cstdio>
#include <string>
#include <ltbf/segment.hpp>

namespace ltbf {

static std::string num(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.9g", v);
  return buf;
}

void write_json(std::ostream& out, const std::vector<SegmentSummary>& rows) {
  out << "[";
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const auto& r = rows[i];
    out << (i == 0 ? "\n" : ",\n");
    out << "  {"
        << "\"segment\":" << r.segment
        << ",\"label\":\"" << segment_label(r.segment) << "\""
        << ",\"avg_dt\":" << num(r.avg_dt)
        << ",\"best_dt\":" << num(r.best_dt)
        << ",\"best_lap\":" << r.best_lap
        << ",\"time_loss\":" << num(r.loss)
        << ",\"loss\":" << num(r.loss)
        << ",\"loss_percent\":" << (r.loss_percent ? num(*r.loss_percent) : "null")
        << ",\"brake_time_loss\":" << num(r.brake_time_loss)
        << ",\"exit_time_loss\":" << num(r.exit_time_loss)
        << ",\"exit_throttle_delay_loss\":" << num(r.exit_throttle_delay_loss)
        << ",\"entry_time_loss\":" << num(r.entry_time_loss)
        << ",\"throttle_time_loss\":" << num(r.throttle_time_loss)
        << ",\"coast_time_loss\":" << num(r.coast_time_loss)
        << ",\"top_cause\":\"" << cause_label(r.top_cause) << "\""
        << ",\"avg_speed\":" << num(r.avg_speed)
        << ",\"avg_throttle\":" << num(r.avg_throttle)
        << ",\"avg_brake\":" << num(r.avg_brake)
        << ",\"laps\":" << r.laps
        << "}";
  }
  out << (rows.empty() ? "]\n" : "\n]\n");
}

void write_csv(std::ostream& out, const std::vector<SegmentSummary>& rows) {
  out << "segment,label,avg_dt,best_dt,best_lap,time_loss,loss,loss_percent,"
         "brake_time_loss,exit_time_loss,exit_throttle_delay_loss,entry_time_loss,"
         "throttle_time_loss,coast_time_loss,top_cause,avg_speed,avg_throttle,avg_brake,laps\n";
  for (const auto& r : rows) {
    out << r.segment << ","
        << segment_label(r.segment) << ","
        << num(r.avg_dt) << ","
        << num(r.best_dt) << ","
        << r.best_lap << ","
        << num(r.loss) << ","
        << num(r.loss) << ","
        << (r.loss_percent ? num(*r.loss_percent) : "") << ","
        << num(r.brake_time_loss) << ","
        << num(r.exit_time_loss) << ","
        << num(r.exit_throttle_delay_loss) << ","
        << num(r.entry_time_loss) << ","
        << num(r.throttle_time_loss) << ","
        << num(r.coast_time_loss) << ","
        << cause_label(r.top_cause) << ","
        << num(r.avg_speed) << ","
        << num(r.avg_throttle) << ","
        << num(r.avg_brake) << ","
        << r.laps << "\n";
  }
}

void write_table(std::ostream& out, const std::vector<SegmentSummary>& rows) {
  if (rows.empty()) {
    out << "No results. Provide telemetry with at least 2 laps.\n";
    return;
  }
  char line[256];
  std::snprintf(line, sizeof(line), "%-4s %-5s %9s %9s %9s %7s %9s %9s %9s  %s\n",
                "#", "Seg", "Avg(s)", "Best(s)", "Loss(s)", "Loss%",
                "Brake", "Exit", "LateThr", "Top cause");
  out << line;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const auto& r = rows[i];
    char pct[16];
    if (r.loss_percent) std::snprintf(pct, sizeof(pct), "%.2f", *r.loss_percent);
    else std::snprintf(pct, sizeof(pct), "%s", "--");
    std::snprintf(line, sizeof(line), "%-4zu %-5s %9.3f %9.3f %9.3f %7s %9.3f %9.3f %9.3f  %s\n",
                  i + 1, segment_label(r.segment).c_str(), r.avg_dt, r.best_dt, r.loss, pct,
                  r.brake_time_loss, r.exit_time_loss, r.exit_throttle_delay_loss,
                  cause_label(r.top_cause));
    out << line;
  }
}

bool write_report(std::ostream& out, const std::string& format,
                  const std::vector<SegmentSummary>& rows) {
  if (format == "json")     write_json(out, rows);
  else if (format == "csv") write_csv(out, rows);
  else                      write_table(out, rows);
  out.flush();
  return static_cast<bool>(out);
}

} // namespace ltbf
