//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Construction of the evaluation context.  The vtable and associated-constant
// halves of the context live in EvalContext_Vtable.cpp and
// EvalContext_Const.cpp.
//
//===----------------------------------------------------------------------===//

#include "eval/EvalContext.hpp"

#include <utility>

namespace kiln::eval
{

EvalContext::EvalContext(mem::Memory &memory, EvalServices services, traits::ParamEnv paramEnv)
    : memory_(memory), services_(services), paramEnv_(std::move(paramEnv))
{
}

} // namespace kiln::eval
