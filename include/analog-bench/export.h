#ifndef ANALOG_BENCH_EXPORT_H
#define ANALOG_BENCH_EXPORT_H

#ifdef _WIN32
#ifdef analog_bench_core_EXPORTS
#define ANALOG_BENCH_API __declspec(dllexport)
#else
#define ANALOG_BENCH_API __declspec(dllimport)
#endif
#else
#define ANALOG_BENCH_API
#endif

#endif // ANALOG_BENCH_EXPORT_H
