#include "config_loader.hpp"
#include "analyzer/data_structures/analysis_errors.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/logging_macros.hpp"
#include "logging/logs/system_logs.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <vector>

using StockAdvisor::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(),
                       [](unsigned char value_char) { return static_cast<char>(std::tolower(value_char)); });
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    // Period lists use ';' because ',' separates key and value
    inline std::vector<int> to_int_list(const std::string& input_value) {
        std::vector<int> parsed_values;
        std::stringstream list_stream(input_value);
        std::string list_item_string;
        while (std::getline(list_stream, list_item_string, ';')) {
            list_item_string = trim(list_item_string);
            if (list_item_string.empty()) continue;
            parsed_values.push_back(std::stoi(list_item_string));
        }
        return parsed_values;
    }

    bool all_positive(const std::vector<int>& values) {
        return std::all_of(values.begin(), values.end(), [](int value) { return value >= 1; });
    }
}

bool load_config_from_csv(StockAdvisor::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        return false;
    }

    std::string config_line_string;
    int config_line_number = 0;
    while (std::getline(config_file_stream, config_line_string)) {
        ++config_line_number;
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',')) continue;
        if (!std::getline(config_line_stream, config_value_string)) continue;
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        try {
            // Indicator configuration
            if (config_key_string == "indicators.sma_periods") cfg.indicators.sma_periods = to_int_list(config_value_string);
            else if (config_key_string == "indicators.ema_periods") cfg.indicators.ema_periods = to_int_list(config_value_string);
            else if (config_key_string == "indicators.wma_period") cfg.indicators.wma_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.rsi_period") cfg.indicators.rsi_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.macd_fast_period") cfg.indicators.macd_fast_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.macd_slow_period") cfg.indicators.macd_slow_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.macd_signal_period") cfg.indicators.macd_signal_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.stochastic_k_period") cfg.indicators.stochastic_k_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.stochastic_d_period") cfg.indicators.stochastic_d_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.williams_r_period") cfg.indicators.williams_r_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.roc_period") cfg.indicators.roc_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.momentum_period") cfg.indicators.momentum_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.cci_period") cfg.indicators.cci_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.cci_constant") cfg.indicators.cci_constant = std::stod(config_value_string);
            else if (config_key_string == "indicators.bollinger_period") cfg.indicators.bollinger_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.bollinger_stddev_multiplier") cfg.indicators.bollinger_stddev_multiplier = std::stod(config_value_string);
            else if (config_key_string == "indicators.atr_period") cfg.indicators.atr_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.adx_period") cfg.indicators.adx_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.psar_acceleration_step") cfg.indicators.psar_acceleration_step = std::stod(config_value_string);
            else if (config_key_string == "indicators.psar_acceleration_maximum") cfg.indicators.psar_acceleration_maximum = std::stod(config_value_string);
            else if (config_key_string == "indicators.mfi_period") cfg.indicators.mfi_period = std::stoi(config_value_string);
            else if (config_key_string == "indicators.volume_average_period") cfg.indicators.volume_average_period = std::stoi(config_value_string);

            // Pattern configuration
            else if (config_key_string == "patterns.candlestick_scan_bars") cfg.patterns.candlestick_scan_bars = std::stoi(config_value_string);
            else if (config_key_string == "patterns.average_body_lookback") cfg.patterns.average_body_lookback = std::stoi(config_value_string);
            else if (config_key_string == "patterns.trend_lookback") cfg.patterns.trend_lookback = std::stoi(config_value_string);
            else if (config_key_string == "patterns.doji_body_ratio") cfg.patterns.doji_body_ratio = std::stod(config_value_string);
            else if (config_key_string == "patterns.long_body_ratio") cfg.patterns.long_body_ratio = std::stod(config_value_string);
            else if (config_key_string == "patterns.short_body_ratio") cfg.patterns.short_body_ratio = std::stod(config_value_string);
            else if (config_key_string == "patterns.long_shadow_ratio") cfg.patterns.long_shadow_ratio = std::stod(config_value_string);
            else if (config_key_string == "patterns.equal_price_tolerance") cfg.patterns.equal_price_tolerance = std::stod(config_value_string);
            else if (config_key_string == "patterns.extrema_window") cfg.patterns.extrema_window = std::stoi(config_value_string);
            else if (config_key_string == "patterns.min_prominence_pct") cfg.patterns.min_prominence_pct = std::stod(config_value_string);
            else if (config_key_string == "patterns.shoulder_tolerance") cfg.patterns.shoulder_tolerance = std::stod(config_value_string);
            else if (config_key_string == "patterns.head_min_excess") cfg.patterns.head_min_excess = std::stod(config_value_string);
            else if (config_key_string == "patterns.neckline_max_slope") cfg.patterns.neckline_max_slope = std::stod(config_value_string);
            else if (config_key_string == "patterns.double_extreme_tolerance") cfg.patterns.double_extreme_tolerance = std::stod(config_value_string);
            else if (config_key_string == "patterns.triangle_lookback") cfg.patterns.triangle_lookback = std::stoi(config_value_string);
            else if (config_key_string == "patterns.triangle_flat_slope") cfg.patterns.triangle_flat_slope = std::stod(config_value_string);
            else if (config_key_string == "patterns.triangle_min_convergence") cfg.patterns.triangle_min_convergence = std::stod(config_value_string);

            // Level configuration
            else if (config_key_string == "levels.lookback_bars") cfg.levels.lookback_bars = std::stoi(config_value_string);
            else if (config_key_string == "levels.extrema_window") cfg.levels.extrema_window = std::stoi(config_value_string);
            else if (config_key_string == "levels.atr_radius_multiple") cfg.levels.atr_radius_multiple = std::stod(config_value_string);
            else if (config_key_string == "levels.fallback_radius_pct") cfg.levels.fallback_radius_pct = std::stod(config_value_string);
            else if (config_key_string == "levels.min_cluster_points") cfg.levels.min_cluster_points = std::stoi(config_value_string);

            // Signal configuration
            else if (config_key_string == "signals.rsi_oversold") cfg.signals.rsi_oversold = std::stod(config_value_string);
            else if (config_key_string == "signals.rsi_overbought") cfg.signals.rsi_overbought = std::stod(config_value_string);
            else if (config_key_string == "signals.macd_strength_scale") cfg.signals.macd_strength_scale = std::stod(config_value_string);
            else if (config_key_string == "signals.ma_fast_period") cfg.signals.ma_fast_period = std::stoi(config_value_string);
            else if (config_key_string == "signals.ma_slow_period") cfg.signals.ma_slow_period = std::stoi(config_value_string);
            else if (config_key_string == "signals.ma_trend_period") cfg.signals.ma_trend_period = std::stoi(config_value_string);
            else if (config_key_string == "signals.ma_cross_base_strength") cfg.signals.ma_cross_base_strength = std::stod(config_value_string);
            else if (config_key_string == "signals.volume_average_period") cfg.signals.volume_average_period = std::stoi(config_value_string);
            else if (config_key_string == "signals.volume_spike_ratio") cfg.signals.volume_spike_ratio = std::stod(config_value_string);
            else if (config_key_string == "signals.volume_strength_divisor") cfg.signals.volume_strength_divisor = std::stod(config_value_string);
            else if (config_key_string == "signals.pattern_recency_bars") cfg.signals.pattern_recency_bars = std::stoi(config_value_string);
            else if (config_key_string == "signals.level_proximity_pct") cfg.signals.level_proximity_pct = std::stod(config_value_string);
            else if (config_key_string == "signals.level_full_strength_touches") cfg.signals.level_full_strength_touches = std::stoi(config_value_string);
            else if (config_key_string == "signals.rsi_weight") cfg.signals.rsi_weight = std::stod(config_value_string);
            else if (config_key_string == "signals.macd_weight") cfg.signals.macd_weight = std::stod(config_value_string);
            else if (config_key_string == "signals.bollinger_weight") cfg.signals.bollinger_weight = std::stod(config_value_string);
            else if (config_key_string == "signals.moving_average_weight") cfg.signals.moving_average_weight = std::stod(config_value_string);
            else if (config_key_string == "signals.volume_weight") cfg.signals.volume_weight = std::stod(config_value_string);
            else if (config_key_string == "signals.pattern_weight") cfg.signals.pattern_weight = std::stod(config_value_string);
            else if (config_key_string == "signals.level_weight") cfg.signals.level_weight = std::stod(config_value_string);

            // Fundamental configuration
            else if (config_key_string == "fundamentals.valuation_weight") cfg.fundamentals.valuation_weight = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.profitability_weight") cfg.fundamentals.profitability_weight = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.growth_weight") cfg.fundamentals.growth_weight = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.financial_health_weight") cfg.fundamentals.financial_health_weight = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.max_pe_ratio") cfg.fundamentals.max_pe_ratio = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.min_market_cap") cfg.fundamentals.min_market_cap = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.small_cap_opportunity_limit") cfg.fundamentals.small_cap_opportunity_limit = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.strength_score") cfg.fundamentals.strength_score = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.weakness_score") cfg.fundamentals.weakness_score = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.risk_debt_to_equity") cfg.fundamentals.risk_debt_to_equity = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.risk_pe_ratio") cfg.fundamentals.risk_pe_ratio = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.risk_beta") cfg.fundamentals.risk_beta = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.opportunity_pe_ratio") cfg.fundamentals.opportunity_pe_ratio = std::stod(config_value_string);
            else if (config_key_string == "fundamentals.opportunity_revenue_growth") cfg.fundamentals.opportunity_revenue_growth = std::stod(config_value_string);

            // Valuation configuration
            else if (config_key_string == "valuation.risk_free_rate") cfg.valuation.risk_free_rate = std::stod(config_value_string);
            else if (config_key_string == "valuation.equity_risk_premium") cfg.valuation.equity_risk_premium = std::stod(config_value_string);
            else if (config_key_string == "valuation.default_beta") cfg.valuation.default_beta = std::stod(config_value_string);
            else if (config_key_string == "valuation.dcf_horizon_years") cfg.valuation.dcf_horizon_years = std::stoi(config_value_string);
            else if (config_key_string == "valuation.terminal_growth_rate") cfg.valuation.terminal_growth_rate = std::stod(config_value_string);

            // Recommendation configuration
            else if (config_key_string == "recommendation.technical_weight") cfg.recommendation.technical_weight = std::stod(config_value_string);
            else if (config_key_string == "recommendation.decision_threshold") cfg.recommendation.decision_threshold = std::stod(config_value_string);
            else if (config_key_string == "recommendation.single_branch_strength_cap") cfg.recommendation.single_branch_strength_cap = std::stod(config_value_string);

            // Output configuration
            else if (config_key_string == "output.chart_history_bars") cfg.output.chart_history_bars = std::stoi(config_value_string);
            else if (config_key_string == "output.json_indent") cfg.output.json_indent = std::stoi(config_value_string);

            // Logging configuration
            else if (config_key_string == "logging.log_file") cfg.logging.log_file = config_value_string;
            else if (config_key_string == "logging.log_directory") cfg.logging.log_directory = config_value_string;
            else if (config_key_string == "logging.file_logging_enabled") cfg.logging.file_logging_enabled = to_bool(config_value_string);
            else if (config_key_string == "logging.log_indicator_table") cfg.logging.log_indicator_table = to_bool(config_value_string);
            else if (config_key_string == "logging.logging_poll_interval_milliseconds") cfg.logging.logging_poll_interval_milliseconds = std::stoi(config_value_string);

            else {
                SystemLogs::log_unknown_config_key(config_key_string, csv_path);
            }
        } catch (const std::exception& parse_exception_error) {
            throw StockAdvisor::Core::ConfigError("Invalid value for " + config_key_string + " at " + csv_path + ":" +
                                                  std::to_string(config_line_number) + " - " + parse_exception_error.what());
        }
    }

    return true;
}

void load_system_config(StockAdvisor::Config::SystemConfig& config, const std::string& config_directory) {
    // Load configuration from separate logical files
    std::vector<std::string> config_files = {
        config_directory + "/analysis_config.csv",
        config_directory + "/logging_config.csv"
    };

    for (const auto& config_path : config_files) {
        if (!std::filesystem::exists(config_path)) {
            log_message("WARNING: Config file not found, using defaults: " + config_path, "");
            continue;
        }
        if (!load_config_from_csv(config, config_path)) {
            throw StockAdvisor::Core::ConfigError("Failed to open config CSV " + config_path);
        }
    }

    // Validate configuration completeness
    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        SystemLogs::log_configuration_validated(false);
        throw StockAdvisor::Core::ConfigError("Configuration validation failed: " + validation_error);
    }

    SystemLogs::log_configuration_validated(true);
}

bool validate_config(const StockAdvisor::Config::SystemConfig& config, std::string& error_message) {
    // Indicator periods
    if (config.indicators.sma_periods.empty() || !all_positive(config.indicators.sma_periods)) {
        error_message = "indicators.sma_periods must list periods >= 1";
        return false;
    }
    if (config.indicators.ema_periods.empty() || !all_positive(config.indicators.ema_periods)) {
        error_message = "indicators.ema_periods must list periods >= 1";
        return false;
    }
    const std::vector<std::pair<const char*, int>> indicator_periods = {
        {"indicators.wma_period", config.indicators.wma_period},
        {"indicators.rsi_period", config.indicators.rsi_period},
        {"indicators.macd_fast_period", config.indicators.macd_fast_period},
        {"indicators.macd_slow_period", config.indicators.macd_slow_period},
        {"indicators.macd_signal_period", config.indicators.macd_signal_period},
        {"indicators.stochastic_k_period", config.indicators.stochastic_k_period},
        {"indicators.stochastic_d_period", config.indicators.stochastic_d_period},
        {"indicators.williams_r_period", config.indicators.williams_r_period},
        {"indicators.roc_period", config.indicators.roc_period},
        {"indicators.momentum_period", config.indicators.momentum_period},
        {"indicators.cci_period", config.indicators.cci_period},
        {"indicators.bollinger_period", config.indicators.bollinger_period},
        {"indicators.atr_period", config.indicators.atr_period},
        {"indicators.adx_period", config.indicators.adx_period},
        {"indicators.mfi_period", config.indicators.mfi_period},
        {"indicators.volume_average_period", config.indicators.volume_average_period},
        {"signals.ma_fast_period", config.signals.ma_fast_period},
        {"signals.ma_slow_period", config.signals.ma_slow_period},
        {"signals.ma_trend_period", config.signals.ma_trend_period},
        {"signals.volume_average_period", config.signals.volume_average_period},
        {"patterns.average_body_lookback", config.patterns.average_body_lookback},
        {"patterns.trend_lookback", config.patterns.trend_lookback},
        {"patterns.extrema_window", config.patterns.extrema_window},
        {"patterns.triangle_lookback", config.patterns.triangle_lookback},
        {"levels.extrema_window", config.levels.extrema_window},
        {"levels.min_cluster_points", config.levels.min_cluster_points},
        {"valuation.dcf_horizon_years", config.valuation.dcf_horizon_years}
    };
    for (const auto& period_entry : indicator_periods) {
        if (period_entry.second < 1) {
            error_message = std::string(period_entry.first) + " must be >= 1";
            return false;
        }
    }
    if (config.indicators.macd_fast_period >= config.indicators.macd_slow_period) {
        error_message = "indicators.macd_fast_period must be less than indicators.macd_slow_period";
        return false;
    }
    if (config.signals.ma_fast_period >= config.signals.ma_slow_period) {
        error_message = "signals.ma_fast_period must be less than signals.ma_slow_period";
        return false;
    }
    // The signal rules read their averages from the indicator set only
    const std::vector<int>& sma_periods = config.indicators.sma_periods;
    for (int signal_period : {config.signals.ma_fast_period, config.signals.ma_slow_period}) {
        if (std::find(sma_periods.begin(), sma_periods.end(), signal_period) == sma_periods.end()) {
            error_message = "signals moving average period " + std::to_string(signal_period) + " is not in indicators.sma_periods";
            return false;
        }
    }
    if (config.signals.volume_average_period != config.indicators.volume_average_period) {
        error_message = "signals.volume_average_period must equal indicators.volume_average_period";
        return false;
    }
    if (config.indicators.bollinger_stddev_multiplier <= 0.0 || config.indicators.cci_constant <= 0.0) {
        error_message = "indicators.bollinger_stddev_multiplier and indicators.cci_constant must be > 0";
        return false;
    }
    if (config.indicators.psar_acceleration_step <= 0.0 ||
        config.indicators.psar_acceleration_maximum < config.indicators.psar_acceleration_step) {
        error_message = "indicators.psar_acceleration_step must be > 0 and not above indicators.psar_acceleration_maximum";
        return false;
    }

    // Pattern and level geometry
    if (config.patterns.candlestick_scan_bars < 0 || config.levels.lookback_bars < 0) {
        error_message = "patterns.candlestick_scan_bars and levels.lookback_bars must be >= 0";
        return false;
    }
    if (config.patterns.doji_body_ratio <= 0.0 || config.patterns.doji_body_ratio >= 1.0) {
        error_message = "patterns.doji_body_ratio must be between 0 and 1";
        return false;
    }
    if (config.patterns.short_body_ratio >= config.patterns.long_body_ratio) {
        error_message = "patterns.short_body_ratio must be less than patterns.long_body_ratio";
        return false;
    }
    if (config.patterns.min_prominence_pct < 0.0 || config.patterns.shoulder_tolerance <= 0.0 ||
        config.patterns.double_extreme_tolerance <= 0.0 || config.patterns.neckline_max_slope < 0.0 ||
        config.patterns.triangle_flat_slope < 0.0 || config.patterns.triangle_min_convergence < 0.0 ||
        config.patterns.triangle_min_convergence >= 1.0) {
        error_message = "pattern tolerances must be non-negative and triangle_min_convergence below 1";
        return false;
    }
    if (config.levels.atr_radius_multiple <= 0.0 || config.levels.fallback_radius_pct <= 0.0) {
        error_message = "levels.atr_radius_multiple and levels.fallback_radius_pct must be > 0";
        return false;
    }

    // Signal thresholds and weights
    if (!(config.signals.rsi_oversold > 0.0 && config.signals.rsi_oversold < config.signals.rsi_overbought &&
          config.signals.rsi_overbought < 100.0)) {
        error_message = "signals.rsi_oversold and signals.rsi_overbought must satisfy 0 < oversold < overbought < 100";
        return false;
    }
    if (config.signals.macd_strength_scale <= 0.0 || config.signals.volume_strength_divisor <= 0.0 ||
        config.signals.volume_spike_ratio <= 1.0 || config.signals.level_proximity_pct <= 0.0 ||
        config.signals.level_full_strength_touches < 1 || config.signals.pattern_recency_bars < 0) {
        error_message = "signal scales must be positive and signals.volume_spike_ratio above 1";
        return false;
    }
    if (config.signals.ma_cross_base_strength < 0.0 || config.signals.ma_cross_base_strength > 1.0) {
        error_message = "signals.ma_cross_base_strength must be between 0 and 1";
        return false;
    }
    const std::vector<double> signal_weights = {
        config.signals.rsi_weight, config.signals.macd_weight, config.signals.bollinger_weight,
        config.signals.moving_average_weight, config.signals.volume_weight, config.signals.pattern_weight,
        config.signals.level_weight
    };
    double signal_weight_sum = 0.0;
    for (double signal_weight : signal_weights) {
        if (signal_weight < 0.0) {
            error_message = "signal family weights must be >= 0";
            return false;
        }
        signal_weight_sum += signal_weight;
    }
    if (signal_weight_sum <= 0.0) {
        error_message = "at least one signal family weight must be > 0";
        return false;
    }

    // Fundamental weights
    const std::vector<double> category_weights = {
        config.fundamentals.valuation_weight, config.fundamentals.profitability_weight,
        config.fundamentals.growth_weight, config.fundamentals.financial_health_weight
    };
    double category_weight_sum = 0.0;
    for (double category_weight : category_weights) {
        if (category_weight < 0.0) {
            error_message = "fundamental category weights must be >= 0";
            return false;
        }
        category_weight_sum += category_weight;
    }
    if (category_weight_sum <= 0.0) {
        error_message = "at least one fundamental category weight must be > 0";
        return false;
    }
    if (config.fundamentals.max_pe_ratio <= 0.0) {
        error_message = "fundamentals.max_pe_ratio must be > 0";
        return false;
    }
    if (config.fundamentals.weakness_score > config.fundamentals.strength_score) {
        error_message = "fundamentals.weakness_score must not exceed fundamentals.strength_score";
        return false;
    }

    // Valuation assumptions
    if (config.valuation.equity_risk_premium <= 0.0 || config.valuation.default_beta <= 0.0) {
        error_message = "valuation.equity_risk_premium and valuation.default_beta must be > 0";
        return false;
    }
    if (config.valuation.terminal_growth_rate >= config.valuation.risk_free_rate + config.valuation.default_beta * config.valuation.equity_risk_premium) {
        error_message = "valuation.terminal_growth_rate must be below the default discount rate";
        return false;
    }

    // Recommendation
    if (config.recommendation.technical_weight < 0.0 || config.recommendation.technical_weight > 1.0) {
        error_message = "recommendation.technical_weight must be between 0 and 1";
        return false;
    }
    if (config.recommendation.decision_threshold <= 0.0 || config.recommendation.decision_threshold >= 1.0) {
        error_message = "recommendation.decision_threshold must be between 0 and 1 (exclusive)";
        return false;
    }
    if (config.recommendation.single_branch_strength_cap <= 0.0 || config.recommendation.single_branch_strength_cap > 1.0) {
        error_message = "recommendation.single_branch_strength_cap must be in (0, 1]";
        return false;
    }

    // Output and logging
    if (config.output.chart_history_bars < 0) {
        error_message = "output.chart_history_bars must be >= 0";
        return false;
    }
    if (config.logging.logging_poll_interval_milliseconds < 1) {
        error_message = "logging.logging_poll_interval_milliseconds must be >= 1";
        return false;
    }
    if (config.logging.file_logging_enabled && config.logging.log_file.empty()) {
        error_message = "logging.log_file is required when file logging is enabled";
        return false;
    }

    return true;
}
