#pragma once
#include <string.h>
#include <memory>

#include "definitions.h"
#include "profiling.h"
#include <plog/Log.h>

namespace LF {
      /*****************
       ***  Helpers  ***
       *****************/

       /* Character accessors. */
#define CH(off)                 (ctx->text[(off)])
#define STR(off)                (ctx->text + (off))

     /* Character classification.
      * Note we assume ASCII compatibility of code points < 128 here. */
#define ISIN_(ch, ch_min, ch_max)       ((ch_min) <= (unsigned)(ch) && (unsigned)(ch) <= (ch_max))
#define ISANYOF2_(ch, ch1, ch2)         ((ch) == (ch1) || (ch) == (ch2))
#define ISBLANK_(ch)                    (ISANYOF2_((ch), ' ', '\t'))
#define ISNEWLINE_(ch)                  (ISANYOF2_((ch), '\r', '\n'))
#define ISWHITESPACE_(ch)               (ISBLANK_(ch) || ISNEWLINE_(ch) || ISANYOF2_((ch), '\v', '\f'))
#define ISDIGIT_(ch)                    (ISIN_(ch, '0', '9'))
#define ISUPPER_(ch)                    (ISIN_(ch, 'A', 'Z'))

#define ISBLANK(off)                    ISBLANK_(CH(off))
#define ISNEWLINE(off)                  ISNEWLINE_(CH(off))
#define ISWHITESPACE(off)               ISWHITESPACE_(CH(off))
#define ISDIGIT(off)                    ISDIGIT_(CH(off))

      /* Parsing functions*/
#define CHECK_AND_RET(fct) \
    ret = (fct); \
    if (!ret) \
        goto abort;

      /**************
      *** Context ***
      ***************/
      /* The context is used throughout the span parsing and keeps stored
       * all the necessary informations for decoding one line
      */
      struct Context {
            /* Information given by the user */
            const CHAR* text;
            SIZE size;
            const MathTranspiler* transpiler;
            IdGenerator* ids;

            /* Current nesting of styled spans */
            int depth = 0;
      };

      /* Fills the services of ctx from options, falling back on the defaults */
      inline void setup_context(Context* ctx, const std::string& text, const Options& options, const MathTranspiler* fallback_transpiler, IdGenerator* fallback_ids) {
            ctx->text = text.c_str();
            ctx->size = (SIZE)text.length();
            ctx->transpiler = options.transpiler ? options.transpiler : fallback_transpiler;
            ctx->ids = options.ids ? options.ids : fallback_ids;
            ctx->depth = 0;
      }
}
