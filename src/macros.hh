#pragma once

#include "errors.hh"
#include "logger.hh"

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::runtime_error(__err);                                   \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

/// Like EXPECT, but throws the typed error @p ErrorT.
#define EXPECT_T(e, ErrorT, ...)                                               \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw ErrorT(__err);                                               \
        }                                                                      \
    } while (0)

#define EXPECT_VALID_ARGUMENT(e, ...)                                          \
    do {                                                                       \
        if (!(e)) {                                                            \
            LOG_ERROR(__VA_ARGS__);                                            \
            return Cf2ZarrStatusCode_InvalidArgument;                          \
        }                                                                      \
    } while (0)
