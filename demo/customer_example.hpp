#pragma once

void customer_example();
