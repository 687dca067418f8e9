//
// Created by usatiynyan.
//

#pragma once

#include "sl/rx/model/cancellation.hpp"
#include "sl/rx/model/disposable.hpp"
#include "sl/rx/model/observable.hpp"
#include "sl/rx/model/observer.hpp"
