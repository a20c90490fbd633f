#pragma once
#include <cstdarg>
#include <cstdio>
#include <string>
#include <spdlog/spdlog.h>

inline void log_printf_impl(spdlog::level::level_enum lvl, const char* format, ...) {
	if (!spdlog::should_log(lvl)) {
		return;
	}
	va_list args;
	va_start(args, format);
	va_list sized;
	va_copy(sized, args);
	int length = vsnprintf(nullptr, 0, format, sized);
	va_end(sized);
	if (length < 0) {
		va_end(args);
		spdlog::log(lvl, "{}", format);
		return;
	}
	std::string buf(static_cast<size_t>(length) + 1, '\0');
	vsnprintf(buf.data(), buf.size(), format, args);
	va_end(args);
	buf.resize(static_cast<size_t>(length));
	spdlog::log(lvl, "{}", buf);
}

#define LOG_D(format, ...) \
	do { \
		log_printf_impl(spdlog::level::debug, format __VA_OPT__(,) __VA_ARGS__); \
	} while (0)

#define LOG_I(format, ...) \
	do { \
		log_printf_impl(spdlog::level::info, format __VA_OPT__(,) __VA_ARGS__); \
	} while (0)

#define LOG_W(format, ...) \
	do { \
		log_printf_impl(spdlog::level::warn, format __VA_OPT__(,) __VA_ARGS__); \
	} while (0)

#define LOG_E(format, ...) \
	do { \
		log_printf_impl(spdlog::level::err, format __VA_OPT__(,) __VA_ARGS__); \
	} while (0)
