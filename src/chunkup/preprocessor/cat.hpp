#ifndef CHUNKUP_PREPROCESSOR_CAT_HPP
#define CHUNKUP_PREPROCESSOR_CAT_HPP

#define CHUNKUP_PP_CAT(a, b) CHUNKUP_PP_CAT_I(a, b)
#define CHUNKUP_PP_CAT_I(a, b) a ## b

#endif // CHUNKUP_PREPROCESSOR_CAT_HPP
