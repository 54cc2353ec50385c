#ifndef DSPFSCREENSIZE_H
#define DSPFSCREENSIZE_H

/*
* Copyright 2025 Rochus Keller <mailto:me@rochus-keller.ch>
*
* This file is part of the DspfEdit parser/navigator project.
*
* The following is the license that applies to this copy of the
* file. For a license to use the file under conditions
* other than those described here, please email to me@rochus-keller.ch.
*
* GNU General Public License Usage
* This file may be used under the terms of the GNU General Public
* License (GPL) versions 2.0 or 3.0 as published by the Free Software
* Foundation and appearing in the file LICENSE.GPL included in
* the packaging of this file. Please review the following information
* to ensure GNU General Public Licensing requirements will be met:
* http://www.fsf.org/licensing/licenses/info/GPLv2.html and
* http://www.gnu.org/copyleft/gpl.html.
*/

#include <DspfAst.h>

namespace Dspf
{
    class ScreenSize
    {
    public:
        // default size from the file level DSPSIZ, per record size from WINDOW
        static void resolve(Document&);

        // DSPSIZ(rows cols [label] [rows cols [label]]) or DSPSIZ(*DS3 [*DS4])
        static bool parseDisplaySize(const QString& keyword, Size* primary, Size* secondary = 0);
        // WINDOW(startRow startCol rows cols)
        static bool parseWindow(const QString& keyword, Size* window);

        static Size standard();
        static Size predefined(const QString& label);
    };
}

#endif // DSPFSCREENSIZE_H
