// Invariant checks that remain enabled in release builds.
//
// CHECK() is for conditions that can only fail because of a bug in this
// project (for example, Solve() failing to complete a grid whose seeded
// digits are known to be consistent). It is not for validating input; parse
// functions return an empty optional instead.

#ifndef CHECK_H_INCLUDED
#define CHECK_H_INCLUDED

[[noreturn]] void CheckFail(const char *file, int line, const char *expr);

#define CHECK(x) do { if (!(x)) [[unlikely]] CheckFail(__FILE__, __LINE__, #x); } while (0)

#endif  //ndef CHECK_H_INCLUDED
