//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/cancel/bridge.hpp"
#include "sl/rx/cancel/stop_token.hpp"
#include "sl/rx/disposable/single_assignment.hpp"
#include "sl/rx/log/log.hpp"
#include "sl/rx/model.hpp"
#include "sl/rx/observer/error.hpp"
#include "sl/rx/observer/functor.hpp"
#include "sl/rx/observer/weak.hpp"
#include "sl/rx/source/subject.hpp"
#include "sl/rx/subscribe/weak.hpp"
