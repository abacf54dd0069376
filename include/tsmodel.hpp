#ifndef TSM_TSMODEL_HPP
#define TSM_TSMODEL_HPP

/**
 * Model contract library
 *
 * Shape- and integrity-checked predictive models whose predictions are
 * memoized in a content-addressed cache that survives dump/load.
 *
 * Models included:
 * - AutoRegModel (differenced vector autoregression on tensors)
 * - AutoRegFrameModel (the same recurrence on time-indexed frames)
 */

#include "errors.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "tensor.hpp"
#include "serialization.hpp"
#include "contract.hpp"
#include "memo_cache.hpp"
#include "time_frame.hpp"
#include "model.hpp"
#include "integrity_model.hpp"
#include "autoreg.hpp"
#include "config.hpp"

#endif // TSM_TSMODEL_HPP
