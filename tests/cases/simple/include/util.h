#pragma once

int util_answer();
