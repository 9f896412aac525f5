#pragma once

#include <QString>

#include "NavigationState.h"
#include "Transfer/TransferTypes.h"

// Text shown by the window; kept free of widgets so it can be tested headless.
namespace DisplayFormat {

// Human-readable size (B / KB / MB / GB), one decimal above bytes.
QString prettySize(quint64 bytes);

// "../" for the parent link, "name/" for directories, "name" for files.
QString itemLabel(const NavigationState::Item& item);

// "Downloading 'name' 1.5 KB/3.0 KB..."; total shown as "?" when unknown.
QString progressLabel(const TransferTask& task);

// 0..100; 0 when the total is unknown.
int progressPercent(const TransferTask& task);

} // namespace DisplayFormat
