#pragma once

// Logging control: define RESUMEDL_ENABLE_LOG to enable engine logs
#ifdef RESUMEDL_ENABLE_LOG
#include <iostream>
#define RESUMEDL_LOG(stmt)                                                                         \
    do {                                                                                           \
        stmt;                                                                                      \
    } while (0)
#else
#define RESUMEDL_LOG(stmt)                                                                         \
    do {                                                                                           \
    } while (0)
#endif
