#pragma once

#include "logger.hh"

#include <stdexcept>

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::runtime_error(__err);                                   \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

// contract violations by the caller, as opposed to runtime failures
#define EXPECT_ARGUMENT(e, ...)                                                \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::invalid_argument(__err);                                \
        }                                                                      \
    } while (0)

#define EXPECT_VALID_ARGUMENT(e, ...)                                          \
    do {                                                                       \
        if (!(e)) {                                                            \
            LOG_ERROR(__VA_ARGS__);                                            \
            return H5StreamStatusCode_InvalidArgument;                         \
        }                                                                      \
    } while (0)

#define EXPECT_VALID_INDEX(e, ...)                                             \
    do {                                                                       \
        if (!(e)) {                                                            \
            LOG_ERROR(__VA_ARGS__);                                            \
            return H5StreamStatusCode_InvalidIndex;                            \
        }                                                                      \
    } while (0)
