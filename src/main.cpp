/*
 * Copyright (C) 2025 EPAM Systems, Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <app/app.hpp>

POCO_APP_MAIN(vpcctl::app::App);
