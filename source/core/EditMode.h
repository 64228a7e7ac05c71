#pragma once

// ============================================================================
// EditMode - Active editing tool of a segmentation editor session
// ============================================================================

#include <QString>
#include <QMetaType>

/**
 * @brief Editing tools. Exactly one is active per editor session.
 */
enum class EditMode {
    View,           ///< Navigate only; clicking a polygon starts editing it
    EditVertices,   ///< Drag/insert/remove vertices of the selected polygon
    CreatePolygon,  ///< Draw a new polygon point by point
    AddPoints,      ///< Add a run of points to the selected polygon's outline
    Slice,          ///< Cut the selected polygon in two with a line
    DeletePolygon   ///< Clicking a polygon removes it
};

inline QString editModeName(EditMode mode)
{
    switch (mode) {
        case EditMode::View:          return QStringLiteral("View");
        case EditMode::EditVertices:  return QStringLiteral("EditVertices");
        case EditMode::CreatePolygon: return QStringLiteral("CreatePolygon");
        case EditMode::AddPoints:     return QStringLiteral("AddPoints");
        case EditMode::Slice:         return QStringLiteral("Slice");
        case EditMode::DeletePolygon: return QStringLiteral("DeletePolygon");
    }
    return QStringLiteral("View");
}

Q_DECLARE_METATYPE(EditMode)
