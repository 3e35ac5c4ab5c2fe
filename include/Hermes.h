#ifndef HERMES_LIBRARY_H
#define HERMES_LIBRARY_H

#include "../src/core.hpp"
#include "../src/network.hpp"
#include "../src/layer/layer.hpp"
#include "../src/loss/loss.hpp"
#include "../src/data/data.hpp"
#include "../src/parameter/codec.hpp"
#include "../src/autodiff/autodiff.hpp"
#include "../src/evaluation/evaluation.hpp"
#include "../src/training/callback.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Hermes::Model is the state an optimizer talks to: dimension, flat vector,
//    objective / gradient / Hessian evaluators, minibatch cursors, accuracy.
//  - Everything is header-only; link against libtorch.

#endif // HERMES_LIBRARY_H
