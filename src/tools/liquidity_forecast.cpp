#include <boost/program_options.hpp>
#include <liquidity/config/options_file.hpp>
#include <liquidity/forecast/fingerprint.hpp>
#include <liquidity/forecast/projector.hpp>
#include <liquidity/ingest/booking_csv.hpp>
#include <liquidity/schema/alert_severity.hpp>
#include <liquidity/schema/cashflow_direction.hpp>
#include <liquidity/schema/primitives.hpp>
#include <liquidity/schema/recurrence_frequency.hpp>
#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace po = boost::program_options;
using namespace liquidity::schema;

void setup_logging(const std::optional<std::string>& log_file,
                   const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  // Reports go to stdout, so the console sink writes to stderr.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (log_file.has_value()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "forecast", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

std::string format_runway(const std::optional<double>& runway) {
  if (!runway.has_value()) {
    return "unbounded";
  }
  return fmt::format("{:.1f} weeks", *runway);
}

void print_report(const forecast_result_t& result) {
  auto& out = std::cout;
  out << fmt::format("Liquidity forecast from {} over {} weeks\n",
                     format_date(result.reference_date), result.horizon_weeks);
  out << fmt::format("Start balance {}, threshold {}\n\n",
                     format_currency(result.start_balance),
                     format_currency(result.threshold));

  out << "Weeks\n";
  for (const auto& week : result.weeks) {
    out << fmt::format(
        "  CW {:>2} {} .. {}  in {:>16}  out {:>16}  close {:>16}  "
        "[{} .. {}]  conf {:.2f}\n",
        week.calendar_week, format_date(week.start_date),
        format_date(week.end_date), format_currency(week.inflows),
        format_currency(week.outflows), format_currency(week.closing_balance),
        format_currency(week.lower_bound), format_currency(week.upper_bound),
        week.confidence);
  }

  out << "\nAlerts\n";
  if (result.alerts.empty()) {
    out << "  none\n";
  }
  for (const auto& alert : result.alerts) {
    out << fmt::format("  [{}] {}\n", to_string(alert.severity),
                       alert.message);
  }

  const auto& kpis = result.kpis;
  out << "\nKPIs\n";
  out << fmt::format("  current balance       {}\n",
                     format_currency(kpis.current_balance));
  out << fmt::format("  minimum balance       {}{}\n",
                     format_currency(kpis.min_balance),
                     kpis.min_balance_week
                         ? fmt::format(" (CW {})", *kpis.min_balance_week)
                         : std::string{});
  out << fmt::format("  burn rate             {}\n",
                     format_currency(kpis.burn_rate));
  out << fmt::format("  runway                {}\n",
                     format_runway(kpis.runway_weeks));
  out << fmt::format("  avg weekly inflow     {}\n",
                     format_currency(kpis.avg_weekly_inflow));
  out << fmt::format("  avg weekly outflow    {}\n",
                     format_currency(kpis.avg_weekly_outflow));
  out << fmt::format("  total inflow          {}\n",
                     format_currency(kpis.total_projected_inflow));
  out << fmt::format("  total outflow         {}\n",
                     format_currency(kpis.total_projected_outflow));

  out << "\nInsights\n";
  for (const auto& insight : result.insights) {
    out << "  - " << insight << '\n';
  }

  out << "\nRecurring patterns\n";
  if (result.recurring_patterns.empty()) {
    out << "  none\n";
  }
  for (const auto& pattern : result.recurring_patterns) {
    out << fmt::format("  {} ({}) {} {} x{} conf {:.2f} [{}]\n",
                       pattern.description,
                       pattern.counterparty.value_or("unknown"),
                       to_string(pattern.frequency),
                       format_currency(pattern.average_amount),
                       pattern.occurrences, pattern.confidence,
                       pattern.category);
  }

  out << "\nCategories\n";
  for (const auto& item : result.category_breakdown) {
    out << fmt::format("  {:<24} {:<7} {:>16}  {:>6.2f}%\n", item.name,
                       to_string(item.direction),
                       format_currency(item.total_amount), item.percentage);
  }

  out << fmt::format("\nFingerprint {}\n",
                     to_hex(liquidity::forecast::forecast_fingerprint(result)));
}

}  // namespace

int main(int argc, const char** argv) {
  auto bookings_path = std::string{};
  auto format = std::string{};
  auto now_text = std::string{};
  auto config = forecast_config_t{};

  auto description = po::options_description{"liquidity_forecast options"};
  description.add_options()("help,h", "show help")(
      "bookings,b", po::value<std::string>(&bookings_path)->required(),
      "booking history CSV")(
      "start-balance,s", po::value<double>(&config.start_balance)->required(),
      "bank balance at the reference date")(
      "now,n", po::value<std::string>(&now_text)->required(),
      "reference date YYYY-MM-DD")(
      "threshold,t",
      po::value<double>(&config.threshold)->default_value(kDefaultThreshold),
      "warning threshold")(
      "weeks,w",
      po::value<int32_t>(&config.weeks)->default_value(kDefaultHorizonWeeks),
      "forecast horizon in weeks")("options,o", po::value<std::string>(),
                                   "forecast options INI file")(
      "format,f", po::value<std::string>(&format)->default_value("text"),
      "text|hex")("log-file", po::value<std::string>(), "also log to file")(
      "verbose,v", "enable debug logging");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << "error: " << e.what() << '\n' << description << std::endl;
    return 1;
  }

  auto log_file = std::optional<std::string>{};
  if (vm.contains("log-file")) {
    log_file = vm["log-file"].as<std::string>();
  }
  setup_logging(log_file, vm.contains("verbose"));

  auto fail = [](const std::string& message) {
    spdlog::error("{}", message);
    spdlog::shutdown();
    return 1;
  };

  if (format != "text" && format != "hex") {
    return fail(fmt::format("unknown format '{}'", format));
  }

  config.now = try_parse_date(now_text);
  if (!config.now.has_value()) {
    return fail(fmt::format("invalid --now date '{}'", now_text));
  }

  auto error = std::string{};
  auto options = liquidity::forecast::default_forecast_options();
  if (vm.contains("options")) {
    auto loaded = liquidity::config::load_forecast_options(
        vm["options"].as<std::string>(), error);
    if (!loaded) {
      return fail(error);
    }
    options = std::move(*loaded);
  }

  auto batch = liquidity::ingest::read_bookings(
      std::filesystem::path{bookings_path}, error);
  if (!batch) {
    return fail(error);
  }

  auto engine = liquidity::forecast::projector{std::move(options)};
  auto result = engine.project(batch->bookings, config, error);
  if (!result) {
    return fail(error);
  }

  if (format == "hex") {
    std::cout << to_hex(liquidity::forecast::encode_result(*result))
              << std::endl;
  } else {
    print_report(*result);
    std::cout.flush();
  }

  spdlog::shutdown();
  return 0;
}
