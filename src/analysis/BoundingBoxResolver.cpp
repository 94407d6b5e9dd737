#include "BoundingBoxResolver.h"
#include "CalculationDiagnostics.h"
#include <QDebug>

bool BoundingBoxResolver::resolve(const Surface *surfaceA,
                                  const Surface *surfaceB,
                                  BoundingBox &boxOut,
                                  CalculationDiagnostics &diagnostics)
{
    if (!surfaceA || !surfaceB) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                             QString("Surface %1 is null").arg(surfaceA ? "B" : "A"));
        return false;
    }

    if (surfaceA->isEmpty() && surfaceB->isEmpty()) {
        diagnostics.setError(CalculationDiagnostics::Error::EmptyData,
                             QString("Surfaces '%1' and '%2' have no points")
                                 .arg(surfaceA->name(), surfaceB->name()));
        return false;
    }

    BoundingBox box;
    box.expand(surfaceA->bounds());
    box.expand(surfaceB->bounds());

    qDebug() << "Bounding box: [" << box.minX << "," << box.minY << "] to ["
             << box.maxX << "," << box.maxY << "]";

    boxOut = box;
    return true;
}
