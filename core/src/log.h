#pragma once

#include <fmt/format.h>

#include <string>

/*
 * Log utilities:
 * LOGD: Debug log, PAGEVIEW_LOG_LEVEL >= 4
 * LOGI: Info log, PAGEVIEW_LOG_LEVEL >= 3
 * LOGW: Warning log, PAGEVIEW_LOG_LEVEL >= 2
 * LOGE: Error log, PAGEVIEW_LOG_LEVEL >= 1
 */

#ifndef PAGEVIEW_LOG_LEVEL
#define PAGEVIEW_LOG_LEVEL 2
#endif

namespace PageView {

void logMsg(const char* level, const char* file, int line, const std::string& msg);

}

#define PAGEVIEW_LOG(level, ...) \
    PageView::logMsg(level, __FILE__, __LINE__, fmt::format(__VA_ARGS__))

#if PAGEVIEW_LOG_LEVEL >= 4
#define LOGD(...) PAGEVIEW_LOG("DEBUG", __VA_ARGS__)
#else
#define LOGD(...)
#endif

#if PAGEVIEW_LOG_LEVEL >= 3
#define LOGI(...) PAGEVIEW_LOG("INFO", __VA_ARGS__)
#else
#define LOGI(...)
#endif

#if PAGEVIEW_LOG_LEVEL >= 2
#define LOGW(...) PAGEVIEW_LOG("WARNING", __VA_ARGS__)
#else
#define LOGW(...)
#endif

#if PAGEVIEW_LOG_LEVEL >= 1
#define LOGE(...) PAGEVIEW_LOG("ERROR", __VA_ARGS__)
#else
#define LOGE(...)
#endif
