// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 TipCalc Authors

/**
 * @file main.cpp
 * @brief Application entry point
 *
 * @see tipcalc::Application
 */

#include "application.h"

int main(int argc, char** argv) {
    tipcalc::Application app;
    return app.run(argc, argv);
}
