/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MODAL_PRESENTER_HPP
#define MODAL_PRESENTER_HPP

#include <string>

namespace CloudDefenders {

/**
 * @brief Host-side surface that shows the end-of-game dialog.
 */
class ModalPresenter {
public:
    virtual ~ModalPresenter() = default;

    virtual void showModal(const std::string& title, const std::string& message, int score) = 0;
};

} // namespace CloudDefenders

#endif // MODAL_PRESENTER_HPP
