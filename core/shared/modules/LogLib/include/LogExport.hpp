#ifndef BACLINK_LOG_EXPORT_HPP
#define BACLINK_LOG_EXPORT_HPP

/**
 * @file LogExport.hpp
 * @brief LogLib 공유 라이브러리 심볼 export 매크로
 */

#if defined(BACLINK_STATIC) && !defined(LOGLIB_STATIC)
#define LOGLIB_STATIC
#endif

#if defined(LOGLIB_STATIC)
#define LOGLIB_API
#elif __GNUC__ >= 4
#define LOGLIB_API __attribute__((visibility("default")))
#else
#define LOGLIB_API
#endif

#endif // BACLINK_LOG_EXPORT_HPP
