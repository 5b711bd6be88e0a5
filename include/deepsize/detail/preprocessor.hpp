// -----------------------------------------------------------------------------
// Variadic macro iteration (up to 32 arguments)
//
//   DEEPSIZE_DETAIL_FOR_EACH(m, a, b, c)          -> m(a) m(b) m(c)
//   DEEPSIZE_DETAIL_FOR_EACH_ARG(m, x, a, b, c)   -> m(x, a) m(x, b) m(x, c)
//   DEEPSIZE_DETAIL_COUNT(a, b, c)                -> 3
//   DEEPSIZE_DETAIL_IS_PAREN((a, b))              -> 1
//   DEEPSIZE_DETAIL_IS_PAREN(a)                   -> 0
// -----------------------------------------------------------------------------
#pragma once

#define DEEPSIZE_DETAIL_EXPAND(x) x

#define DEEPSIZE_DETAIL_FE_1(m, x) m(x)
#define DEEPSIZE_DETAIL_FE_2(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_1(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_3(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_2(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_4(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_3(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_5(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_4(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_6(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_5(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_7(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_6(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_8(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_7(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_9(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_8(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_10(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_9(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_11(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_10(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_12(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_11(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_13(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_12(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_14(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_13(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_15(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_14(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_16(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_15(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_17(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_16(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_18(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_17(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_19(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_18(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_20(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_19(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_21(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_20(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_22(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_21(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_23(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_22(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_24(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_23(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_25(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_24(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_26(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_25(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_27(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_26(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_28(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_27(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_29(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_28(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_30(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_29(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_31(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_30(m, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FE_32(m, x, ...) m(x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FE_31(m, __VA_ARGS__))

#define DEEPSIZE_DETAIL_FEA_1(m, a, x) m(a, x)
#define DEEPSIZE_DETAIL_FEA_2(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_1(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_3(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_2(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_4(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_3(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_5(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_4(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_6(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_5(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_7(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_6(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_8(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_7(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_9(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_8(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_10(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_9(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_11(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_10(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_12(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_11(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_13(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_12(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_14(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_13(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_15(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_14(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_16(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_15(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_17(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_16(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_18(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_17(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_19(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_18(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_20(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_19(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_21(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_20(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_22(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_21(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_23(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_22(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_24(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_23(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_25(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_24(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_26(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_25(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_27(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_26(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_28(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_27(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_29(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_28(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_30(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_29(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_31(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_30(m, a, __VA_ARGS__))
#define DEEPSIZE_DETAIL_FEA_32(m, a, x, ...) m(a, x) DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_FEA_31(m, a, __VA_ARGS__))

#define DEEPSIZE_DETAIL_PICK(_1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13, _14, _15, _16, _17, _18, _19, _20, _21, _22, _23, _24, _25, _26, _27, _28, _29, _30, _31, _32, NAME, ...) NAME

#define DEEPSIZE_DETAIL_FOR_EACH(m, ...) \
    DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_PICK(__VA_ARGS__, \
        DEEPSIZE_DETAIL_FE_32, DEEPSIZE_DETAIL_FE_31, DEEPSIZE_DETAIL_FE_30, DEEPSIZE_DETAIL_FE_29, DEEPSIZE_DETAIL_FE_28, DEEPSIZE_DETAIL_FE_27, DEEPSIZE_DETAIL_FE_26, DEEPSIZE_DETAIL_FE_25, DEEPSIZE_DETAIL_FE_24, DEEPSIZE_DETAIL_FE_23, DEEPSIZE_DETAIL_FE_22, DEEPSIZE_DETAIL_FE_21, DEEPSIZE_DETAIL_FE_20, DEEPSIZE_DETAIL_FE_19, DEEPSIZE_DETAIL_FE_18, DEEPSIZE_DETAIL_FE_17, DEEPSIZE_DETAIL_FE_16, DEEPSIZE_DETAIL_FE_15, DEEPSIZE_DETAIL_FE_14, DEEPSIZE_DETAIL_FE_13, DEEPSIZE_DETAIL_FE_12, DEEPSIZE_DETAIL_FE_11, DEEPSIZE_DETAIL_FE_10, DEEPSIZE_DETAIL_FE_9, DEEPSIZE_DETAIL_FE_8, DEEPSIZE_DETAIL_FE_7, DEEPSIZE_DETAIL_FE_6, DEEPSIZE_DETAIL_FE_5, DEEPSIZE_DETAIL_FE_4, DEEPSIZE_DETAIL_FE_3, DEEPSIZE_DETAIL_FE_2, DEEPSIZE_DETAIL_FE_1)(m, __VA_ARGS__))

#define DEEPSIZE_DETAIL_FOR_EACH_ARG(m, a, ...) \
    DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_PICK(__VA_ARGS__, \
        DEEPSIZE_DETAIL_FEA_32, DEEPSIZE_DETAIL_FEA_31, DEEPSIZE_DETAIL_FEA_30, DEEPSIZE_DETAIL_FEA_29, DEEPSIZE_DETAIL_FEA_28, DEEPSIZE_DETAIL_FEA_27, DEEPSIZE_DETAIL_FEA_26, DEEPSIZE_DETAIL_FEA_25, DEEPSIZE_DETAIL_FEA_24, DEEPSIZE_DETAIL_FEA_23, DEEPSIZE_DETAIL_FEA_22, DEEPSIZE_DETAIL_FEA_21, DEEPSIZE_DETAIL_FEA_20, DEEPSIZE_DETAIL_FEA_19, DEEPSIZE_DETAIL_FEA_18, DEEPSIZE_DETAIL_FEA_17, DEEPSIZE_DETAIL_FEA_16, DEEPSIZE_DETAIL_FEA_15, DEEPSIZE_DETAIL_FEA_14, DEEPSIZE_DETAIL_FEA_13, DEEPSIZE_DETAIL_FEA_12, DEEPSIZE_DETAIL_FEA_11, DEEPSIZE_DETAIL_FEA_10, DEEPSIZE_DETAIL_FEA_9, DEEPSIZE_DETAIL_FEA_8, DEEPSIZE_DETAIL_FEA_7, DEEPSIZE_DETAIL_FEA_6, DEEPSIZE_DETAIL_FEA_5, DEEPSIZE_DETAIL_FEA_4, DEEPSIZE_DETAIL_FEA_3, DEEPSIZE_DETAIL_FEA_2, DEEPSIZE_DETAIL_FEA_1)(m, a, __VA_ARGS__))

#define DEEPSIZE_DETAIL_COUNT(...) \
    DEEPSIZE_DETAIL_EXPAND(DEEPSIZE_DETAIL_PICK(__VA_ARGS__, 32, 31, 30, 29, 28, 27, 26, 25, 24, 23, 22, 21, 20, 19, 18, 17, 16, 15, 14, 13, 12, 11, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1))

#define DEEPSIZE_DETAIL_CAT(a, b) DEEPSIZE_DETAIL_CAT_I(a, b)
#define DEEPSIZE_DETAIL_CAT_I(a, b) a##b

#define DEEPSIZE_DETAIL_SECOND(a, b, ...) b
#define DEEPSIZE_DETAIL_PAREN_MARK(...) ~, 1
#define DEEPSIZE_DETAIL_IS_PAREN(x) DEEPSIZE_DETAIL_IS_PAREN_I(DEEPSIZE_DETAIL_PAREN_MARK x, 0, ~)
#define DEEPSIZE_DETAIL_IS_PAREN_I(...) DEEPSIZE_DETAIL_SECOND(__VA_ARGS__)
