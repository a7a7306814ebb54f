/*
 * Copyright 2025 Davide Faconti
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include "pcdcodec/basic_types.hpp"
#include "pcdcodec/column.hpp"
#include "pcdcodec/errors.hpp"
#include "pcdcodec/header.hpp"
#include "pcdcodec/options.hpp"
#include "pcdcodec/pcd_reader.hpp"
#include "pcdcodec/pcd_writer.hpp"
